// Copyright 2025 The Cobalt Authors. All Rights Reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef CSPBUILDER_CSPBUILDER_EXPORT_H_
#define CSPBUILDER_CSPBUILDER_EXPORT_H_

#if defined(COMPONENT_BUILD)
#if defined(WIN32)
#if defined(CSPBUILDER_IMPLEMENTATION)
#define CSPBUILDER_EXPORT __declspec(dllexport)
#else
#define CSPBUILDER_EXPORT __declspec(dllimport)
#endif  // defined(CSPBUILDER_IMPLEMENTATION)

#else
#if defined(CSPBUILDER_IMPLEMENTATION)
#define CSPBUILDER_EXPORT __attribute__((visibility("default")))
#else
#define CSPBUILDER_EXPORT
#endif  // defined(CSPBUILDER_IMPLEMENTATION)
#endif  // defined(WIN32)

#else
#define CSPBUILDER_EXPORT
#endif  // defined(COMPONENT_BUILD)

#endif  // CSPBUILDER_CSPBUILDER_EXPORT_H_
