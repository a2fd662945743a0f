#pragma once

namespace cassette {

enum class SnapshotMode {
    Replay,
    Record,
    Bypass
};

enum class MatchPolicy {
    Positional,
    Strict
};

enum class FacadeState {
    Uninitialized,
    Loaded,
    Closed
};

} // namespace cassette
