#ifndef RFC4122_INTERNAL_EXPORT_HPP
#define RFC4122_INTERNAL_EXPORT_HPP

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

/// @cond INTERNAL

/// import/export macros
#if defined(WIN32) && !defined(RFC4122_DECLARE_STATIC)
  //
  // Import and Export definitions for Windows:
  //
#  define RFC4122_EXPORT __declspec(dllexport)
#  define RFC4122_IMPORT __declspec(dllimport)
#  define RFC4122_CLASS_EXPORT
#  define RFC4122_CLASS_IMPORT
#else
  //
  // Non-Windows (Linux, etc.) definitions:
  //
#  define RFC4122_EXPORT __attribute ((visibility ("default")))
#  define RFC4122_IMPORT
#  define RFC4122_CLASS_EXPORT __attribute ((visibility ("default")))
#  define RFC4122_CLASS_IMPORT
#endif

// For rfc4122-cpp library symbols
#ifdef rfc4122_cpp_EXPORTS
#  define RFC4122_EXTERN RFC4122_EXPORT
#  define RFC4122_CLASS_EXTERN RFC4122_CLASS_EXPORT
#else
#  define RFC4122_EXTERN RFC4122_IMPORT
#  define RFC4122_CLASS_EXTERN RFC4122_CLASS_IMPORT
#endif

/// @endcond

#endif // RFC4122_INTERNAL_EXPORT_HPP
