/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2023 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#pragma once

/*
 * Host imports available to the BIOS. All host calls return a negative value
 * on failure; the values are listed below.
 */
#include <stddef.h>
#include <stdint.h>

#define HOST_EMEMORYFAULT -1
#define HOST_ECBORDECODE -2
#define HOST_ESTRINGDECODE -3
#define HOST_EBUFFERTOOSHORT -4
#define HOST_ENOSUCHCOMPONENT -5
#define HOST_ENOSUCHMETHOD -6
#define HOST_EBADPARAMETERS -7
#define HOST_EQUEUEFULL -8
#define HOST_EQUEUEEMPTY -9
#define HOST_EBADDESCRIPTOR -10
#define HOST_ETOOMANYDESCRIPTORS -11
#define HOST_EOTHER -12
#define HOST_EUNKNOWN -13

#define HOST_UUID_LENGTH 16

#if defined(__wasm__)
#define HOST_IMPORT(module, name) __attribute__((import_module(module), import_name(name)))
#else
#define HOST_IMPORT(module, name)
#endif

#ifdef __cplusplus
extern "C" {
#endif

// Starts listing components, optionally only those whose type matches. A null
// type lists all components. Any listing already in progress is abandoned.
HOST_IMPORT("component", "list_start")
int32_t host_component_list_start(const char* type, size_t type_len);

// Writes the next listed UUID to address; returns 1 if an entry was written,
// 0 at the end of the listing.
HOST_IMPORT("component", "list_next")
int32_t host_component_list_next(uint8_t* address);

// Writes the type of a component; returns the length of the type.
HOST_IMPORT("component", "component_type")
int32_t host_component_type(const uint8_t* address, char* buffer, size_t len);

// Starts a method call; params is a CBOR sequence or null for no parameters.
// Returns 1 if the call finished immediately, 0 if the result will only be
// available on the next timeslice.
HOST_IMPORT("component", "invoke_component_method")
int32_t host_component_invoke(const uint8_t* address, const char* method, size_t method_len, const uint8_t* params);

// Collects the CBOR-encoded result of the last call; returns the length.
HOST_IMPORT("component", "invoke_end")
int32_t host_component_invoke_end(uint8_t* buffer, size_t len);

HOST_IMPORT("computer", "error")
__attribute__((noreturn)) void host_computer_error(const char* message, size_t len);

HOST_IMPORT("descriptor", "close")
int32_t host_descriptor_close(uint32_t descriptor);

// Appends bytes to the execution buffer.
HOST_IMPORT("execute", "add")
int32_t host_execute_add(const uint8_t* data, size_t len);

// Replaces the running program with the contents of the execution buffer.
HOST_IMPORT("execute", "execute")
__attribute__((noreturn)) void host_execute_execute(void);

#ifdef __cplusplus
}
#endif
