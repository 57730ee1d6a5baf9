/**
 * @file input_decoder.fwd.hpp
 */
#pragma once
#include "gridact/common/common.hpp"
#include "gridact/common/grid_enums.hpp"

namespace gridact
{

struct ElementDomain;

template <typename T>
struct ValueDomain;

} // namespace gridact
