#ifndef RFC4122_LOGGER_INTERNAL_HPP
#define RFC4122_LOGGER_INTERNAL_HPP

/*
 *
 * Licensed to the Apache Software Foundation (ASF) under one
 * or more contributor license agreements.  See the NOTICE file
 * distributed with this work for additional information
 * regarding copyright ownership.  The ASF licenses this file
 * to you under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in compliance
 * with the License.  You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing,
 * software distributed under the License is distributed on an
 * "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
 * KIND, either express or implied.  See the License for the
 * specific language governing permissions and limitations
 * under the License.
 *
 */

#include "msg.hpp"

#include "rfc4122/logger.hpp"

/// Log to the default logger. The message is only formatted if the
/// logger would emit it.
///
///     RFC4122_LOG(SUBSYSTEM_PARSE, LEVEL_DEBUG, "bad length " << n);
#define RFC4122_LOG(SUBSYS, SEV, MESSAGE) \
    do { \
        ::rfc4122::logger& l_ = ::rfc4122::logger::default_logger(); \
        if (l_.enabled(::rfc4122::logger::SUBSYS, ::rfc4122::logger::SEV)) \
            l_.log(::rfc4122::logger::SUBSYS, ::rfc4122::logger::SEV, MSG(MESSAGE)); \
    } while(0)

#endif // RFC4122_LOGGER_INTERNAL_HPP
