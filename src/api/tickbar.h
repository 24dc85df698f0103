#ifndef TICKBAR_H
#define TICKBAR_H

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* Opaque bar token, 0 is the null handle. */
typedef uint64_t tickbar_handle;

#define TICKBAR_FLAG_LEAVE   0x01u
#define TICKBAR_FLAG_DISABLE 0x02u
#define TICKBAR_FLAG_ASCII   0x04u
#define TICKBAR_FLAG_ASYNC   0x20u

/*
 * Process-wide engine. tickbar_init reads the YAML config (if any) and must
 * be called before any bar call; repeated calls are no-ops. Returns 0 on
 * success, -1 on failure. tickbar_shutdown closes every open bar and
 * releases the engine; init may be called again afterwards.
 */
int tickbar_init(void);
void tickbar_shutdown(void);

/* Returns 0 when the bar cannot be created (engine not initialised, no free
 * slot, allocation or thread failure). total <= 0 means unknown length. */
tickbar_handle tickbar_create(int64_t total, const char* desc, int64_t desc_len, uint32_t flags);
tickbar_handle tickbar_create_async(int64_t total, const char* desc, int64_t desc_len, uint32_t flags);

/* Error codes reported by tickbar_last_error(). */
#define TICKBAR_OK                   0
#define TICKBAR_E_INVALID_HANDLE     1
#define TICKBAR_E_HANDLE_CLOSED      2
#define TICKBAR_E_NOT_INITIALISED    3
#define TICKBAR_E_CAPACITY           4
#define TICKBAR_E_RESOURCE           5
#define TICKBAR_E_INTERNAL           6

/* Post-increment count, or -1 for a null, unknown or closed handle. A count
 * may itself be negative when n < 0, so -1 is ambiguous: check
 * tickbar_last_error() to tell a real count from a failure. */
int64_t tickbar_update(tickbar_handle handle, int64_t n);
int64_t tickbar_update_async(tickbar_handle handle, int64_t n);
int64_t tickbar_read(tickbar_handle handle);

/* No-ops on invalid handles. close and close_async are idempotent. */
void tickbar_render(tickbar_handle handle);
void tickbar_close(tickbar_handle handle);
void tickbar_close_async(tickbar_handle handle);
void tickbar_set_description(tickbar_handle handle, const char* desc, int64_t desc_len);

/* Outcome of the calling thread's last create, update, update_async or read:
 * TICKBAR_OK or one of the TICKBAR_E_* codes. */
int tickbar_last_error(void);

/* Never fail: fall back to 80 columns, clock is monotonic. */
int64_t tickbar_terminal_width(void);
int64_t tickbar_time_ns(void);

#ifdef __cplusplus
}
#endif

#endif /* TICKBAR_H */
