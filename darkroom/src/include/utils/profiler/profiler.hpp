//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#pragma once

// easy_profiler blocks around decode/encode/inference.
// Usage:
//   #include "utils/profiler/profiler.hpp"
//   EASY_BLOCK("Decode");
//
// Blocks are recorded only when the build defines BUILD_WITH_EASY_PROFILER
// (see DARKROOM_ENABLE_PROFILER in CMakeLists.txt); otherwise easy_profiler
// expands them to nothing.

#include <easy/profiler.h>
