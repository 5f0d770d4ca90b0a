#pragma once

#define CHUNKD_DEFAULT_BIND "0.0.0.0"
#define CHUNKD_DEFAULT_PORT 3000
#define CHUNKD_DEFAULT_TEMP_DIR "./temp"
#define CHUNKD_DEFAULT_FINAL_DIR "./uploads"
#define CHUNKD_DEFAULT_SERVER_THREADS 4
#define CHUNKD_DEFAULT_MAX_BODY (256ull * 1024 * 1024)
#define CHUNKD_DEFAULT_RATE_LIMIT_MAX 3
#define CHUNKD_DEFAULT_MAX_TOTAL_CHUNKS 100000
#define CHUNKD_DEFAULT_RATE_LIMIT_WINDOW 10
