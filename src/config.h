#pragma once

// Compile-time defaults. The #ifndef-guarded ones can be set from the build
// flags; most can also be set from the runtime JSON config (config/hub_config.h)

// Hub identity
#define HUB_SERVICE        "cozyhub"
#define HUB_VERSION        "1.0.0"

// Device service port (TCP session protocol and subnet probe)
#ifndef DEVICE_TCP_PORT
#define DEVICE_TCP_PORT    5555
#endif

// Broadcast discovery
#ifndef DISCOVERY_UDP_PORT
#define DISCOVERY_UDP_PORT           6095
#endif
#ifndef DISCOVERY_BROADCAST_ADDRESS
#define DISCOVERY_BROADCAST_ADDRESS  "255.255.255.255"
#endif
#define DISCOVERY_SEND_COUNT          3
#define DISCOVERY_SEND_GAP_MS         30
#define DISCOVERY_FIRST_REPLY_TRIES   5
#define DISCOVERY_RECEIVE_TIMEOUT_MS  100
#define DISCOVERY_MAX_REPLIES         255

// Subnet probe. Batches run one after another, so a scan takes
// ceil(hosts / batch) * SUBNET_PROBE_TIMEOUT_MS. The batch is also capped at
// the open-file limit minus SUBNET_PROBE_FD_RESERVE; with the usual 1024
// limit a /22 needs two windows and a /16 about 69. Raise `ulimit -n` and
// subnet_scan.batch_size together for large ranges.
#define SUBNET_PROBE_TIMEOUT_MS  1000
#define SUBNET_PROBE_BATCH_SIZE  1024
#define SUBNET_PROBE_FD_RESERVE  64
#define SUBNET_MAX_HOSTS         65536

// Session
#define SESSION_CONNECT_TIMEOUT_MS   10000
#define SESSION_RESPONSE_TIMEOUT_MS  5000
#define SESSION_QUERY_ATTEMPTS       3
#define SESSION_MAX_LINE_LENGTH      2048

// Reconciliation (seconds)
#ifndef SCAN_INTERVAL_S
#define SCAN_INTERVAL_S          300
#endif
#define SCAN_INTERVAL_MIN_S      60
#define STATUS_INTERVAL_S        30

// Debug levels (compile-time)
#define DEBUG_LEVEL_NONE   0
#define DEBUG_LEVEL_ERROR  1
#define DEBUG_LEVEL_INFO   2
#define DEBUG_LEVEL_DEBUG  3
#define DEBUG_LEVEL_TRACE  4

#ifndef DEBUG_LEVEL
#define DEBUG_LEVEL        DEBUG_LEVEL_INFO
#endif
