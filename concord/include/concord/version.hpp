#pragma once

#define CONCORD_VERSION "1.3.0"
#define CONCORD_PROTOCOL_VERSION_MAJOR 1
#define CONCORD_PROTOCOL_VERSION_MINOR 0

// Bumped whenever the JSONL layout of persisted audit entries changes
#define CONCORD_AUDIT_FORMAT 1

namespace concord {
namespace version {

// major/minor are the peer daemon's protocol version. Same major required;
// the daemon's minor must be at least ours.
inline bool protocol_compatible(int major, int minor) {
    return major == CONCORD_PROTOCOL_VERSION_MAJOR &&
           minor >= CONCORD_PROTOCOL_VERSION_MINOR;
}

inline bool audit_format_supported(int format) {
    return format >= 1 && format <= CONCORD_AUDIT_FORMAT;
}

} // namespace version
} // namespace concord
