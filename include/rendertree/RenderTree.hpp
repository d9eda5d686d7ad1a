#pragma once
#include "component/Component.hpp"
#include "component/ComponentType.hpp"
#include "component/ComponentTypeRegistry.hpp"
#include "component/RenderPass.hpp"
#include "core/Error.hpp"
#include "tree/ArrayBuilder.hpp"
#include "tree/ArrayRange.hpp"
#include "tree/AttributeValue.hpp"
#include "tree/BuilderOptions.hpp"
#include "tree/FrameJson.hpp"
#include "tree/FrameTraversal.hpp"
#include "tree/RenderTreeBuilder.hpp"
#include "tree/RenderTreeFrame.hpp"
