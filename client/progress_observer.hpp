#pragma once

// ============================================================
// progress_observer.hpp -- Feeds client session events into the TUI
// ============================================================

#include "../common/transfer_observer.hpp"
#include "../common/tui.hpp"

class ProgressObserver : public TransferObserver {
public:
    explicit ProgressObserver(TuiState& state) : state_(state) {}

    void on_file(const FileEvent& ev) override {
        state_.set_current(ev.rel_path);
        if (ev.outcome == FileOutcome::SENT) {
            state_.files_done.fetch_add(1);
            state_.wire_bytes.fetch_add(ev.compressed_size);
        } else {
            state_.files_failed.fetch_add(1);
        }
        // Skipped files still count towards the bar reaching 100%
        state_.bytes_done.fetch_add(ev.original_size);
    }

private:
    TuiState& state_;
};
