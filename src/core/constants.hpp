#pragma once

// ── Names ───────────────────────────────────────────────────
constexpr const char* DATA_DIR_NAME        = ".crew";    // per-repository data root
constexpr const char* DEFAULT_SESSION_PREFIX = "crew";
constexpr const char* CONFIG_ENV_VAR       = "CREW_CONFIG";
constexpr const char* CREW_VERSION         = "0.4.0";

// ── tmux session metadata keys ──────────────────────────────
constexpr const char* ENV_PROJECT_PATH     = "CREW_PROJECT_PATH";
constexpr const char* ENV_NUM_EXPERTS      = "CREW_NUM_EXPERTS";
constexpr const char* ENV_CREATED_AT       = "CREW_CREATED_AT";

// ── Readiness marker contents (queue/status/expert<N>) ──────
constexpr const char* MARKER_STARTING      = "starting";
constexpr const char* MARKER_PENDING       = "pending";     // idle, waiting for work
constexpr const char* MARKER_PROCESSING    = "processing";  // working

// ── Timeouts ────────────────────────────────────────────────
constexpr int DEFAULT_NUM_EXPERTS          = 4;
constexpr int AGENT_READY_TIMEOUT_SECS     = 30;    // Readiness wait budget per launch
constexpr int EXIT_GRACE_MS                = 3000;  // Wait after asking an agent to exit
constexpr int STUCK_AFTER_SECS             = 600;   // Busy this long with a quiet pane = stuck
constexpr int TICK_MS                      = 100;   // Control loop input wait per tick
constexpr int CAPTURE_INTERVAL_MS          = 1000;  // Pane snapshot refresh
constexpr int READY_POLL_MS                = 500;   // Readiness poll interval
constexpr int INSTRUCTION_CHUNK_DELAY_MS   = 50;    // Gap between send-keys chunks

// ── Sizes ───────────────────────────────────────────────────
constexpr int INSTRUCTION_CHUNK_SIZE       = 200;   // Bytes per send-keys call
constexpr int MAX_BRANCH_NAME_LEN          = 50;
constexpr int ACTIVITY_PREVIEW_LEN         = 60;
constexpr int ACTIVITY_EXEC_WINDOW         = 15;    // Trailing lines scanned for tool use
constexpr int ACTIVITY_THINK_WINDOW        = 10;    // Trailing lines scanned for spinners
constexpr int STATUS_HISTORY_LIMIT         = 8;     // Status lines kept by the control loop
constexpr int MAX_INSTRUCTION_DECISIONS    = 10;
constexpr int TASK_DECISION_PREVIEW_LEN    = 100;
constexpr int MAX_LISTED_DECISIONS         = 8;     // Shown by the tower's decisions command
constexpr int TOWER_DECISION_AUTHOR        = -1;    // made_by for decisions typed at the tower
