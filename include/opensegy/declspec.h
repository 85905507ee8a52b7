// Copyright 2017-2020, Schlumberger
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

#if defined OPENSEGY_STATIC || !defined _WIN32
    #define OPENSEGY_API
    #define OPENSEGY_TEST_API
#else
    #ifdef OPENSEGY_DLL
        #define OPENSEGY_API      __declspec(dllexport) // this is the public API
        #define OPENSEGY_TEST_API __declspec(dllexport) // exported only for unit tests
    #else
        #define OPENSEGY_API      __declspec(dllimport)
        #define OPENSEGY_TEST_API __declspec(dllimport)
    #endif
#endif
