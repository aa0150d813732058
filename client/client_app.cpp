// ============================================================
// client_app.cpp -- filepush client: scan, connect, push
// ============================================================

#include "client_app.hpp"
#include "client_session.hpp"
#include "dir_scanner.hpp"
#include "progress_observer.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "../common/tui.hpp"
#include <iostream>
#include <memory>
#include <vector>

ClientApp::ClientApp(const ClientConfig& cfg)
    : cfg_(cfg)
{
    LOG_INFO("ClientApp: src_dir=" + cfg_.src_dir +
             " server=" + cfg_.host + ":" + std::to_string(cfg_.port));
}

int ClientApp::run() {
    u64 t0 = utils::now_ms();

    // --- Step 1: discover files ---
    DirScanner scanner(cfg_.src_dir);
    std::vector<FileEntry> files = scanner.scan();
    if (scanner.scan_errors() > 0) {
        LOG_ERROR(std::to_string(scanner.scan_errors()) + " error(s) while scanning " +
                  cfg_.src_dir + "; the push will be incomplete");
    }

    // --- Step 2: optional progress display ---
    TuiState tui_state;
    tui_state.files_total.store((u32)files.size());
    tui_state.bytes_total.store(scanner.total_bytes());

    std::unique_ptr<ProgressObserver> progress;
    std::unique_ptr<Tui> tui;
    if (cfg_.show_progress) {
        progress = std::make_unique<ProgressObserver>(tui_state);
        tui = std::make_unique<Tui>(tui_state);
    }
    TransferObserver& observer =
        progress ? static_cast<TransferObserver&>(*progress) : TransferObserver::none();

    // --- Step 3: connect and push ---
    ClientSession session(observer);
    bool ok = true;
    try {
        session.connect(cfg_.host, cfg_.port);
        if (tui) {
            Logger::get().set_console_muted(true);
            tui->start();
        }

        for (const FileEntry& fe : files) {
            if (!session.send_file(fe)) ok = false;
        }
        session.finish();
    } catch (const TransportError&) {
        // ClientSession has already logged and moved to FAILED
        ok = false;
    }
    if (tui) {
        tui->stop();
        Logger::get().set_console_muted(false);
    }

    const ClientStats& st = session.stats();
    u64 elapsed = utils::now_ms() - t0;
    double secs = elapsed > 0 ? (double)elapsed / 1000.0 : 0.001;

    std::cout << "Pushed " << st.files_sent << "/" << files.size() << " files, "
              << utils::format_bytes(st.bytes_original) << " ("
              << utils::format_bytes(st.bytes_on_wire) << " on wire) in "
              << utils::format_duration_s(elapsed / 1000) << ", "
              << utils::format_speed((double)st.bytes_original / secs) << "\n";
    if (st.files_skipped > 0) {
        std::cout << st.files_skipped << " file(s) skipped, see log\n";
    }
    if (scanner.scan_errors() > 0) {
        std::cout << scanner.scan_errors() << " scan error(s), see log\n";
    }

    if (session.state() != ClientState::CLOSED) {
        LOG_ERROR("Session ended in state " + std::string(client_state_str(session.state())));
        return 1;
    }
    return ok && scanner.scan_errors() == 0 ? 0 : 1;
}
