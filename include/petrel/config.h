// Copyright 2018 Vladislav Yaremenko
// Licensed under the Apache License, Version 2.0 (the "License"); you may not use this file except in compliance with the License. You may obtain a copy of the License at http://www.apache.org/licenses/LICENSE-2.0 . Unless required by applicable law or agreed to in writing, software distributed under the License is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied. See the License for the specific language governing permissions and limitations under the License.

#pragma once

#include "platform_detection.h"
#include "petrel_export.h"


#ifndef PETREL_NAMESPACE_START
#   define PETREL_NAMESPACE petrel
#   define PETREL_NAMESPACE_START namespace PETREL_NAMESPACE {
#   define PETREL_NAMESPACE_END };
#endif

#ifndef PETREL_GUTS_NAMESPACE_START
#   define PETREL_GUTS_NAMESPACE guts
#   define PETREL_GUTS_NAMESPACE_START namespace PETREL_GUTS_NAMESPACE {
#   define PETREL_GUTS_NAMESPACE_END };
#endif


#define PETREL_DISABLE_COPY(c)             \
    private:                               \
        c(const c&) = delete;              \
        c& operator=(const c&) = delete;


#define PETREL_DISABLE_MOVE(c)             \
    private:                               \
        c(c&&) = delete;                   \
        c& operator=(c&&) = delete;

