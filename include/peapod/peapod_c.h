#ifndef PEAPOD_PEAPOD_C_H
#define PEAPOD_PEAPOD_C_H

/*
 * C ABI for hosts that cannot use the C++ API (JNI, Swift, FFI).
 *
 * All buffers are owned by the caller and copied in and out. Functions that
 * write variable-length output return the number of bytes written, or -1 on
 * error (null argument, buffer too small, rejected input). Calls on one handle
 * are serialized internally, so any host thread may call.
 *
 * Calls that change engine state (on_request, peer_left, on_message_received,
 * on_chunk_received, serve_chunk, decline_chunk, tick) never drop their
 * output. When it does not fit in out_buf they return
 * PEAPOD_ERR_BUFFER_TOO_SMALL and keep it on the handle: read its size with
 * peapod_pending_output and copy it out with peapod_take_output. Until then
 * those calls return PEAPOD_ERR_PENDING_OUTPUT without doing anything.
 *
 * Integers in output buffers are little-endian.
 *
 * Action list layout (peer_left, on_message_received, on_request, tick):
 *   u32 count, then per action a u8 kind:
 *     0 SendMessage:       peer_id[16], u32 len, frame[len]
 *     1 FetchChunk:        transfer_id[16], u64 start, u64 end, u8 has_peer,
 *                          peer_id[16] (zero if !has_peer), u32 url_len, url[url_len]
 *     2 TransferAbandoned: transfer_id[16]
 */

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef struct peapod_handle peapod_handle;

#define PEAPOD_DEVICE_ID_SIZE 16
#define PEAPOD_PUBLIC_KEY_SIZE 32
#define PEAPOD_SESSION_KEY_SIZE 32
#define PEAPOD_HANDSHAKE_SIZE 49

#define PEAPOD_ERR_BUFFER_TOO_SMALL (-2)
#define PEAPOD_ERR_PENDING_OUTPUT (-3)

/* Protocol version byte carried in beacons and handshakes */
uint8_t peapod_version(void);

/* New instance with a fresh identity; NULL on failure */
peapod_handle* peapod_create(void);

/* New instance restoring a 32-byte X25519 private key; NULL on failure */
peapod_handle* peapod_create_with_key(const uint8_t* private_key_32);

/* No-op on NULL */
void peapod_destroy(peapod_handle* h);

/* 16 bytes; 0 or -1 */
int peapod_device_id(peapod_handle* h, uint8_t* out_buf, size_t out_len);

/* Framed Beacon / DiscoveryResponse; bytes written or -1 */
int peapod_beacon_frame(peapod_handle* h, uint16_t listen_port, uint8_t* out_buf, size_t out_len);
int peapod_discovery_response_frame(peapod_handle* h, uint16_t listen_port, uint8_t* out_buf, size_t out_len);

/* Decode a Beacon or DiscoveryResponse frame; 0 or -1 */
int peapod_decode_discovery_frame(const uint8_t* bytes, size_t len, uint8_t* out_device_id_16,
                                  uint8_t* out_public_key_32, uint16_t* out_listen_port);

/* 49-byte handshake; 0 or -1 */
int peapod_handshake_bytes(peapod_handle* h, uint8_t* out_buf, size_t out_len);

/* Session key shared with the peer; 0 or -1 */
int peapod_session_key(peapod_handle* h, const uint8_t* peer_public_key_32, uint8_t* out_session_key_32);

/* Raw ChaCha20-Poly1305; bytes written or -1 */
int peapod_encrypt(const uint8_t* session_key_32, uint64_t nonce, const uint8_t* plain, size_t plain_len,
                   uint8_t* out_buf, size_t out_len);
int peapod_decrypt(const uint8_t* session_key_32, uint64_t nonce, const uint8_t* cipher, size_t cipher_len,
                   uint8_t* out_buf, size_t out_len);

/*
 * Request metadata. The range is inclusive and only used when
 * range_end > range_start. Returns 0 = Fallback, 1 = Accelerate, -1 = error,
 * or PEAPOD_ERR_BUFFER_TOO_SMALL with the Accelerate output kept.
 * On Accelerate out_buf holds: transfer_id[16], u64 total_length, u32 n,
 * n * (device_id[16], u64 start, u64 end), then an action list.
 */
int peapod_on_request(peapod_handle* h, const uint8_t* url, size_t url_len, uint64_t range_start,
                      uint64_t range_end, int eligible, uint8_t* out_buf, size_t out_len);

/* 0 or -1 */
int peapod_peer_joined(peapod_handle* h, const uint8_t* device_id_16, const uint8_t* public_key_32);

/* Action list; bytes written, 0 when there is nothing to do, -1 on error */
int peapod_peer_left(peapod_handle* h, const uint8_t* device_id_16, uint8_t* out_buf, size_t out_len);

/*
 * One encrypted frame from a peer. out_buf holds u32 body_len,
 * transfer_id[16] (zero unless body_len > 0), body[body_len], then an action
 * list. Bytes written or -1.
 */
int peapod_on_message_received(peapod_handle* h, const uint8_t* peer_id_16, const uint8_t* msg, size_t msg_len,
                               uint8_t* out_buf, size_t out_len);

/* 0 = in progress, 1 = complete (body in out_buf), -1 = error. A body that
 * does not fit is kept (PEAPOD_ERR_BUFFER_TOO_SMALL). */
int peapod_on_chunk_received(peapod_handle* h, const uint8_t* transfer_id_16, uint64_t start, uint64_t end,
                             const uint8_t* hash_32, const uint8_t* payload, size_t payload_len,
                             uint8_t* out_buf, size_t out_len);

/* ChunkData / Nack frame answering a peer's request; bytes written or -1 */
int peapod_serve_chunk(peapod_handle* h, const uint8_t* peer_id_16, const uint8_t* transfer_id_16,
                       uint64_t start, uint64_t end, const uint8_t* payload, size_t payload_len,
                       uint8_t* out_buf, size_t out_len);
int peapod_decline_chunk(peapod_handle* h, const uint8_t* peer_id_16, const uint8_t* transfer_id_16,
                         uint64_t start, uint64_t end, uint8_t* out_buf, size_t out_len);

/* Action list; bytes written, 0 when there is nothing to do, -1 on error */
int peapod_tick(peapod_handle* h, uint8_t* out_buf, size_t out_len);

/* Size of output kept by the last PEAPOD_ERR_BUFFER_TOO_SMALL; 0 if none */
size_t peapod_pending_output(peapod_handle* h);

/*
 * Copy kept output exactly as the original call would have written it, and
 * release it. Bytes written (0 if none), or -1 if out_buf is too small; the
 * output stays kept in that case.
 */
int peapod_take_output(peapod_handle* h, uint8_t* out_buf, size_t out_len);

#ifdef __cplusplus
}
#endif

#endif /* PEAPOD_PEAPOD_C_H */
