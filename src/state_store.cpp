#include "state_store.hpp"

#include <fstream>
#include <mutex>
#include <system_error>
#include <unistd.h>

#include "lock_utils.hpp"
#include "logger.hpp"
#include "system_utils.hpp"

namespace fs = std::filesystem;

namespace gitpet {

namespace {

std::mutex& store_mutex() {
    static std::mutex mtx;
    return mtx;
}

void report(const std::string& msg, const fs::path& file, const std::string& detail = "") {
    if (!logger_initialized())
        return;
    LogFields fields{{"path", file.string()}};
    if (!detail.empty())
        fields["error"] = detail;
    log_error(msg, fields);
}

} // namespace

StateStore::StateStore(fs::path file) : file_(std::move(file)) {}

fs::path StateStore::lock_path() const {
    fs::path p = file_;
    p += ".lock";
    return p;
}

fs::path StateStore::default_path() {
    auto home = procutil::home_directory();
    fs::path base = home ? *home : fs::path();
    return base / ".gitpet" / "state.json";
}

ProgressionState StateStore::load(std::time_t now) const {
    std::error_code ec;
    if (!fs::exists(file_, ec))
        return default_state(now);
    std::ifstream ifs(file_);
    if (!ifs) {
        report("Failed to open state file", file_);
        return default_state(now);
    }
    nlohmann::json j = nlohmann::json::parse(ifs, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        report("Malformed state file", file_);
        return default_state(now);
    }
    return state_from_json(j, now);
}

bool StateStore::save(const ProgressionState& state) const {
    std::error_code ec;
    if (file_.has_parent_path()) {
        fs::create_directories(file_.parent_path(), ec);
        if (ec) {
            report("Failed to create state directory", file_, ec.message());
            return false;
        }
    }
    std::string text;
    try {
        text = to_json(state).dump(2);
    } catch (const nlohmann::json::exception& e) {
        report("Failed to serialize state", file_, e.what());
        return false;
    }
    fs::path tmp = file_;
    tmp += ".tmp." + std::to_string(static_cast<long>(getpid()));
    {
        std::ofstream ofs(tmp, std::ios::trunc);
        if (!ofs) {
            report("Failed to open temporary state file", tmp);
            return false;
        }
        ofs << text << '\n';
        ofs.flush();
        if (!ofs) {
            report("Failed to write state file", tmp);
            fs::remove(tmp, ec);
            return false;
        }
    }
    fs::rename(tmp, file_, ec);
    if (ec) {
        report("Failed to replace state file", file_, ec.message());
        std::error_code ec2;
        fs::remove(tmp, ec2);
        return false;
    }
    return true;
}

ProgressionState StateStore::update(const std::function<void(ProgressionState&)>& fn,
                                    std::time_t now, bool* saved) const {
    std::lock_guard<std::mutex> lk(store_mutex());
    std::error_code ec;
    if (file_.has_parent_path())
        fs::create_directories(file_.parent_path(), ec);
    procutil::FileLockGuard lock(lock_path());
    if (!lock.locked() && logger_initialized())
        log_warning("Could not lock state file", {{"path", lock_path().string()}});
    ProgressionState state = load(now);
    fn(state);
    bool ok = save(state);
    if (saved)
        *saved = ok;
    return state;
}

bool StateStore::reset() const {
    std::lock_guard<std::mutex> lk(store_mutex());
    std::error_code ec;
    fs::remove(file_, ec);
    if (ec) {
        report("Failed to delete state file", file_, ec.message());
        return false;
    }
    return true;
}

} // namespace gitpet
