#pragma once

#include <cstddef>

constexpr const char* KNADMIN_VERSION = "0.2.0";

// ── Timeouts ────────────────────────────────────────────────
constexpr int SSH_CMD_TIMEOUT_SECS       = 120;   // Max time for a single kubectl command
constexpr int SSH_CHANNEL_OPEN_SECS      = 30;    // Max time to open an exec/tunnel channel

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE          = 4096;
constexpr int TUNNEL_BUF_SIZE            = 16384;
constexpr int DOWNLOAD_BUF_SIZE          = 8192;

// ── Registry ────────────────────────────────────────────────
// Every secret created by 'registry add' carries this label so that
// 'registry remove' only ever touches secrets it owns.
constexpr const char* REGISTRY_LABEL_KEY   = "managed-by";
constexpr const char* REGISTRY_LABEL_VALUE = "kn-admin-registry";
constexpr const char* DOCKER_JSON_NAME     = ".dockerconfigjson";
constexpr const char* DOCKER_SECRET_TYPE   = "kubernetes.io/dockerconfigjson";
constexpr std::size_t K8S_NAME_MAX         = 63;

// ── Profiling ───────────────────────────────────────────────
constexpr const char* PPROF_PATH_PREFIX    = "/debug/pprof/";
constexpr int DEFAULT_PROFILE_SECONDS      = 5;
