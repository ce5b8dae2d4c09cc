#pragma once

#include "core/Error.hpp"
#include "core/Id.hpp"
#include "core/NativeValue.hpp"
#include "history/HistoryJournal.hpp"
#include "history/HistoryRecorder.hpp"
#include "identity/IdentityMap.hpp"
#include "patch/PatchJson.hpp"
#include "patch/PatchSet.hpp"
#include "patch/VirtualValue.hpp"
#include "reconciler/ApplyOptions.hpp"
#include "reconciler/PatchApplier.hpp"
#include "schema/PropertySchema.hpp"
#include "schema/SchemaTable.hpp"
#include "tools/PatchSession.hpp"
#include "tree/LiveTree.hpp"
#include "tree/MemoryTree.hpp"
