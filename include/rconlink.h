/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __RCONLINK_H_INCLUDED__
#define __RCONLINK_H_INCLUDED__

/*  Version macros for compile-time API version detection                     */
#define RCONLINK_VERSION_MAJOR 0
#define RCONLINK_VERSION_MINOR 3
#define RCONLINK_VERSION_PATCH 0

#define RCONLINK_MAKE_VERSION(major, minor, patch)                             \
    ((major) *10000 + (minor) *100 + (patch))
#define RCONLINK_VERSION                                                       \
    RCONLINK_MAKE_VERSION (RCONLINK_VERSION_MAJOR, RCONLINK_VERSION_MINOR,     \
                           RCONLINK_VERSION_PATCH)

#ifdef __cplusplus
extern "C" {
#endif

#include <errno.h>
#include <stddef.h>
#include <stdint.h>

/*  Handle DSO symbol visibility                                             */
#if defined RCONLINK_NO_EXPORT
#define RCONLINK_EXPORT
#else
#if defined _WIN32
#if defined RCONLINK_STATIC
#define RCONLINK_EXPORT
#elif defined DLL_EXPORT
#define RCONLINK_EXPORT __declspec(dllexport)
#else
#define RCONLINK_EXPORT __declspec(dllimport)
#endif
#else
#if (defined __GNUC__ && __GNUC__ >= 4) || defined __INTEL_COMPILER
#define RCONLINK_EXPORT __attribute__ ((visibility ("default")))
#else
#define RCONLINK_EXPORT
#endif
#endif
#endif

/******************************************************************************/
/*  Errors.                                                                   */
/******************************************************************************/
#define RCONLINK_HAUSNUMERO 156384912

#ifndef EPROTO
#define EPROTO (RCONLINK_HAUSNUMERO + 1)
#endif
#ifndef EMSGSIZE
#define EMSGSIZE (RCONLINK_HAUSNUMERO + 2)
#endif
#ifndef ENOBUFS
#define ENOBUFS (RCONLINK_HAUSNUMERO + 3)
#endif

/**
 * @brief Return the errno for the current thread.
 * @return errno value (POSIX errno or RCONLINK_HAUSNUMERO-based code).
 */
RCONLINK_EXPORT int rconlink_errno (void);

/**
 * @brief Return a human-readable string for the given error number.
 * @param errnum_  Error number (e.g. return value of rconlink_errno()).
 * @return Static string pointer. Must not be modified or freed.
 */
RCONLINK_EXPORT const char *rconlink_strerror (int errnum_);

/**
 * @brief Return the runtime library version.
 * @param[out] major_  Major version.
 * @param[out] minor_  Minor version.
 * @param[out] patch_  Patch version.
 */
RCONLINK_EXPORT void rconlink_version (int *major_, int *minor_, int *patch_);

/******************************************************************************/
/*  Source RCON protocol constants.                                           */
/******************************************************************************/

/*  Reserved request ids                                                      */
#define RCONLINK_ID_UNSOLICITED -1
#define RCONLINK_ID_TERMINATOR 999

/*  Response type codes                                                       */
#define RCONLINK_RESPONSE_VALUE 0
#define RCONLINK_AUTH_RESPONSE 2

/*  Request type codes                                                        */
#define RCONLINK_REQUEST_EXECCOMMAND 2
#define RCONLINK_REQUEST_AUTH 3

/*  Decoded frame kinds                                                       */
#define RCONLINK_FRAME_TERMINATOR 1
#define RCONLINK_FRAME_AUTH 2
#define RCONLINK_FRAME_COMMAND 3

/*  Decoder error codes (RCONLINK_LAST_ERROR)                                 */
#define RCONLINK_ERROR_NONE 0
#define RCONLINK_ERROR_MALFORMED_TERMINATOR 1
#define RCONLINK_ERROR_STALLED 2

/******************************************************************************/
/*  Decoder options.                                                          */
/******************************************************************************/
#define RCONLINK_MAXPENDING 1
#define RCONLINK_PENDING 2
#define RCONLINK_LAST_ERROR 3
#define RCONLINK_DISCARDED 4

#define RCONLINK_MAXPENDING_DFLT 65536

/******************************************************************************/
/*  Frames.                                                                   */
/******************************************************************************/

/**
 * @brief One decoded RCON response.
 *
 * Filled by rconlink_decoder_recv(). The body is a NUL-terminated copy owned
 * by the frame until rconlink_frame_close() is called.
 */
typedef struct rconlink_frame_t
{
    int32_t size;
    int32_t id;
    int32_t type;
    int kind;
    char *body;
    size_t body_size;
} rconlink_frame_t;

/**
 * @brief Release the body held by a frame and zero its fields.
 * @return 0 on success, -1 with errno set to EFAULT if frame_ is NULL.
 */
RCONLINK_EXPORT int rconlink_frame_close (rconlink_frame_t *frame_);

/******************************************************************************/
/*  Stream decoder.                                                           */
/******************************************************************************/

/**
 * @brief Create a decoder for one RCON connection.
 *
 * A decoder accumulates bytes across rconlink_decoder_feed() calls and
 * queues every complete, validated frame. Must be released with
 * rconlink_decoder_close().
 *
 * @return Decoder handle, or NULL on failure (errno is set).
 */
RCONLINK_EXPORT void *rconlink_decoder_new (void);

/**
 * @brief Destroy a decoder. Buffered partial frames and queued frames are
 *        dropped.
 * @return 0 on success, -1 with errno set to EFAULT on an invalid handle.
 */
RCONLINK_EXPORT int rconlink_decoder_close (void *decoder_);

/**
 * @brief Set a decoder option.
 *
 * RCONLINK_MAXPENDING takes an int64_t byte count, -1 disables the bound.
 *
 * @return 0 on success, -1 with errno set to EINVAL or EFAULT.
 */
RCONLINK_EXPORT int rconlink_decoder_setopt (void *decoder_,
                                             int option_,
                                             const void *optval_,
                                             size_t optvallen_);

/**
 * @brief Get a decoder option or a read-only decoder property.
 *
 * RCONLINK_PENDING and RCONLINK_DISCARDED are uint64_t, RCONLINK_LAST_ERROR
 * is an int.
 *
 * @return 0 on success, -1 with errno set to EINVAL or EFAULT.
 */
RCONLINK_EXPORT int rconlink_decoder_getopt (void *decoder_,
                                             int option_,
                                             void *optval_,
                                             size_t *optvallen_);

/**
 * @brief Feed newly received bytes into the decoder.
 *
 * @return Number of frames waiting in the queue, or -1 on error. EMSGSIZE
 *         means the buffered bytes exceeded RCONLINK_MAXPENDING without
 *         forming a frame; the buffer was dropped and the connection should
 *         be closed. Frames decoded before the error remain queued.
 */
RCONLINK_EXPORT int
rconlink_decoder_feed (void *decoder_, const void *data_, size_t size_);

/**
 * @brief Pop the oldest decoded frame.
 *
 * The frame must be released with rconlink_frame_close().
 *
 * @return 0 on success, -1 with errno set to EAGAIN if no frame is queued.
 */
RCONLINK_EXPORT int rconlink_decoder_recv (void *decoder_,
                                           rconlink_frame_t *frame_);

/******************************************************************************/
/*  Request encoding.                                                         */
/******************************************************************************/

/**
 * @brief Serialize one RCON packet into buf_.
 *
 * @return Number of bytes written, or -1 with errno set to EINVAL (body
 *         contains a NUL byte), EMSGSIZE (body too large) or ENOBUFS
 *         (buf_size_ too small).
 */
RCONLINK_EXPORT int rconlink_encode (int32_t id_,
                                     int32_t type_,
                                     const char *body_,
                                     size_t body_size_,
                                     void *buf_,
                                     size_t buf_size_);

#ifdef __cplusplus
}
#endif

#endif
