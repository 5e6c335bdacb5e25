#pragma once

#include "Core/Base.hpp"
#include "Core/Config.hpp"
#include "Core/Error.hpp"
#include "Core/Result.hpp"
#include "Core/Version.hpp"

#include "Platform/Platform.hpp"
#include "Platform/Simd.hpp"

#include "Memory/Allocator.hpp"

#include "Table/Control.hpp"
#include "Table/Group.hpp"
#include "Table/Layout.hpp"
#include "Table/RawTable.hpp"

#include "Binding/Concepts.hpp"
#include "Binding/BindingCore.hpp"
#include "Binding/KeyDescMap.hpp"
#include "Binding/EntrySpecMap.hpp"
#include "Binding/ClosureMap.hpp"
#include "Binding/TypedEntrySpec.hpp"

#include "Container/TypedMap.hpp"
