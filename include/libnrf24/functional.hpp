// Copyright 2025 the libnrf24 contributors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <cstddef>

#include <sg14/inplace_function.h>

namespace nrf24 {
/**
 * @brief Callable that stores its target in a local buffer
 *
 * Handlers are kept by value without touching the heap. A callable larger
 * than the buffer fails to compile.
 *
 * @tparam signature - function signature
 * @tparam capacity - bytes reserved for the callable object
 */
template<class signature, std::size_t capacity = 32>
using callback = sg14::inplace_function<signature, capacity>;
}  // namespace nrf24
