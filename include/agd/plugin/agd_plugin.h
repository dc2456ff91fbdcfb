// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#ifndef AGD_PLUGIN_AGD_PLUGIN_H_
#define AGD_PLUGIN_AGD_PLUGIN_H_

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stddef.h>
#include <dlpack/dlpack.h>

// Opaque plugin-owned handles.
typedef struct agd_error agd_error;
typedef struct agd_event agd_event;
typedef struct agd_buffer agd_buffer;
typedef struct agd_copy_stream agd_copy_stream;

// Native error codes. Values are part of the ABI.
typedef enum agd_error_code {
  AGD_ERROR_CODE_OK                  = 0,  // only as an input to event_set/copy_stream_set_error
  AGD_ERROR_CODE_CANCELLED           = 1,
  AGD_ERROR_CODE_UNKNOWN             = 2,
  AGD_ERROR_CODE_INVALID_ARGUMENT    = 3,
  AGD_ERROR_CODE_DEADLINE_EXCEEDED   = 4,
  AGD_ERROR_CODE_NOT_FOUND           = 5,
  AGD_ERROR_CODE_ALREADY_EXISTS      = 6,
  AGD_ERROR_CODE_PERMISSION_DENIED   = 7,
  AGD_ERROR_CODE_RESOURCE_EXHAUSTED  = 8,
  AGD_ERROR_CODE_FAILED_PRECONDITION = 9,
  AGD_ERROR_CODE_ABORTED             = 10,
  AGD_ERROR_CODE_OUT_OF_RANGE        = 11,
  AGD_ERROR_CODE_UNIMPLEMENTED       = 12,
  AGD_ERROR_CODE_INTERNAL            = 13,
  AGD_ERROR_CODE_UNAVAILABLE         = 14,
  AGD_ERROR_CODE_DATA_LOSS           = 15,
  AGD_ERROR_CODE_UNAUTHENTICATED     = 16
} agd_error_code;

// ABI versioning (semantic: major must match, plugin minor <= host minor)
#define AGD_PLUGIN_ABI_VERSION_MAJOR 1
#define AGD_PLUGIN_ABI_VERSION_MINOR 1
#define AGD_PLUGIN_ABI_ENCODE(maj, min) (((uint32_t)(maj) << 16) | ((uint32_t)(min)))
#define AGD_PLUGIN_ABI_VERSION \
  AGD_PLUGIN_ABI_ENCODE(AGD_PLUGIN_ABI_VERSION_MAJOR, AGD_PLUGIN_ABI_VERSION_MINOR)

// === Capability extension chain =====================================================

// Extension kinds. Append-only; unknown kinds must be skipped by the host.
typedef enum agd_extension_type {
  AGD_EXTENSION_TYPE_EXAMPLE        = 0,
  AGD_EXTENSION_TYPE_STREAM         = 1,
  AGD_EXTENSION_TYPE_RAW_BUFFER     = 2,
  AGD_EXTENSION_TYPE_HOST_ALLOCATOR = 3,
  AGD_EXTENSION_TYPE_PROFILER       = 4,
  AGD_EXTENSION_TYPE_LAYOUTS        = 5,
  AGD_EXTENSION_TYPE_CALLBACK       = 6
} agd_extension_type;

// Common header of every extension record. Records are owned by the plugin for
// its whole lifetime; `next` is a link, not ownership. NULL ends the chain.
// `struct_size` is the full size of the concrete record as compiled by the
// plugin and bounds every field the host may read.
typedef struct agd_extension_base {
  int32_t type;                     // agd_extension_type
  size_t struct_size;
  struct agd_extension_base* next;
} agd_extension_base;

// Byte offset one past `field` inside `type`. Used for struct_size gating.
#define AGD_EXTENSION_FIELD_END(type, field) \
  (offsetof(type, field) + sizeof(((type*)0)->field))

// === Ownership-transfer primitives ===================================================

// Deleter invoked by whichever side currently owns `data`. Must not unwind.
typedef void (*agd_deleter_fn)(void* data, void* deleter_arg);

// Completion callback; invoked exactly once per registration, on any thread.
// `error` is NULL on success and owned by the callee otherwise.
typedef void (*agd_event_callback_fn)(agd_error* error, void* user_arg);

// Any `out_done` may be left NULL when the operation already finished
// successfully.

// A byte region paired with the deleter that releases it.
//   - data == NULL  <=>  size == 0 (empty regions carry no pointer)
//   - deleter != NULL whenever data != NULL
//   - the receiving side calls deleter(data, deleter_arg) exactly once
typedef struct agd_chunk {
  void* data;
  size_t size;
  agd_deleter_fn deleter;
  void* deleter_arg;
} agd_chunk;

// === Extension records ===============================================================

// Chunked copy-to-device streams.
typedef struct agd_stream_extension {
  agd_extension_base base;
  agd_error* (*copy_stream_create)(int64_t total_bytes, agd_copy_stream** out_stream);
  agd_error* (*copy_stream_destroy)(agd_copy_stream* stream);
  // Consumes `chunk` on entry, whether or not an error is returned.
  agd_error* (*copy_stream_add_chunk)(agd_copy_stream* stream,
                                      agd_chunk* chunk,
                                      agd_event** out_done);
  agd_error* (*copy_stream_total_bytes)(agd_copy_stream* stream, int64_t* out_total);
  agd_error* (*copy_stream_granule_size)(agd_copy_stream* stream, int64_t* out_granule);
  agd_error* (*copy_stream_current_bytes)(agd_copy_stream* stream, int64_t* out_current);
  // Valid once every byte was consumed; the caller owns the returned buffer.
  agd_error* (*copy_stream_take_buffer)(agd_copy_stream* stream, agd_buffer** out_buffer);
  // Appended in extension revision 2; check struct_size before use.
  // Aborts the stream: pending chunk events resolve with `code` and no buffer
  // is produced. `code` must not be AGD_ERROR_CODE_OK.
  agd_error* (*copy_stream_set_error)(agd_copy_stream* stream,
                                      agd_error_code code,
                                      const char* message,
                                      size_t message_size);
} agd_stream_extension;

// Offset raw copies into/out of an existing buffer. Host memory is borrowed and
// must stay valid until `out_done` resolves.
typedef struct agd_raw_buffer_extension {
  agd_extension_base base;
  agd_error* (*raw_copy_host_to_device)(agd_buffer* dst,
                                        const void* src,
                                        int64_t offset,
                                        int64_t transfer_size,
                                        agd_event** out_done);
  agd_error* (*raw_copy_device_to_host)(agd_buffer* src,
                                        void* dst,
                                        int64_t offset,
                                        int64_t transfer_size,
                                        agd_event** out_done);
  // Appended in extension revision 2; check struct_size before use.
  agd_error* (*raw_get_host_pointer)(agd_buffer* buffer, void** out_ptr);
} agd_raw_buffer_extension;

// Plugin-provided host allocator (e.g. pinned or registered memory).
typedef struct agd_host_allocator_extension {
  agd_extension_base base;
  agd_error* (*host_allocate)(size_t size, size_t alignment, void** out_ptr);
  // Matches agd_deleter_fn so regions can be handed to the host directly.
  agd_deleter_fn host_free;
  void* host_free_arg;
  size_t preferred_alignment;
} agd_host_allocator_extension;

// === Function table ==================================================================

struct agd_api {
  size_t struct_size;       // sizeof(agd_api) as compiled by the plugin
  uint32_t abi_major;       // = AGD_PLUGIN_ABI_VERSION_MAJOR
  uint32_t abi_minor;       // = AGD_PLUGIN_ABI_VERSION_MINOR
  agd_extension_base* extension_start;  // NULL when no extensions

  // Errors
  void (*error_destroy)(agd_error* error);
  void (*error_message)(const agd_error* error, const char** message, size_t* message_size);
  agd_error_code (*error_get_code)(const agd_error* error);

  // Events. Destroying an event does not cancel a registered callback.
  agd_error* (*event_destroy)(agd_event* event);
  agd_error* (*event_is_ready)(agd_event* event, int* out_is_ready);  // 0/1
  // Error the event completed with (caller owns it), NULL on success. Ready events only.
  agd_error* (*event_error)(agd_event* event);
  // Optional (may be NULL); blocks the calling thread until ready.
  agd_error* (*event_await)(agd_event* event);
  // On error return the callback is not retained and never invoked.
  agd_error* (*event_on_ready)(agd_event* event,
                               agd_event_callback_fn callback,
                               void* user_arg);

  // Buffers
  // Consumes `chunk` on entry, whether or not an error is returned.
  agd_error* (*buffer_from_host_chunk)(agd_chunk* chunk,
                                       DLDataType dtype,
                                       const int64_t* dims,
                                       size_t num_dims,
                                       agd_buffer** out_buffer,
                                       agd_event** out_done);
  // Fills `out_region` with a plugin-allocated region; contents are valid once
  // `out_done` resolves. The host releases it through out_region->deleter.
  agd_error* (*buffer_to_host)(agd_buffer* buffer,
                               agd_chunk* out_region,
                               agd_event** out_done);
  agd_error* (*buffer_size_in_bytes)(agd_buffer* buffer, size_t* out_size);
  agd_error* (*buffer_destroy)(agd_buffer* buffer);

  // ABI 1.1; optional, check struct_size before use.
  // A pending event the host completes through event_set.
  agd_error* (*event_create)(agd_event** out_event);
  // Completes a host-created event, with an error unless `code` is
  // AGD_ERROR_CODE_OK. Setting an event twice is an error.
  agd_error* (*event_set)(agd_event* event,
                          agd_error_code code,
                          const char* message,
                          size_t message_size);
};

typedef struct agd_api agd_api;

// Required plugin symbols
uint32_t agd_plugin_get_abi_version(void);
const agd_api* agd_plugin_get_api(void);

#ifdef __cplusplus
} // extern "C"
#endif

#endif // AGD_PLUGIN_AGD_PLUGIN_H_
