/*
 * SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

/**
 * @file app_log.hpp
 * @brief Logging components for the command line front end
 */

#ifndef MONT_APP_APP_LOG_HPP
#define MONT_APP_APP_LOG_HPP

#include "log/components.hpp"

namespace mont::app {

/**
 * @brief Declare logging components for the command line front end
 */
DECLARE_LOG_COMPONENT(AppLog, Cli, Commands, Picker);

} // namespace mont::app

#endif // MONT_APP_APP_LOG_HPP
