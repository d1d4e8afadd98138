#ifndef STATE_STORE_HPP
#define STATE_STORE_HPP

#include <ctime>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include "progression.hpp"

namespace gitpet {

/**
 * @brief JSON file persistence for ProgressionState.
 *
 * Every mutation is a locked read-modify-write against the latest file
 * contents. Failures are logged and never thrown: a state that cannot be read
 * starts from defaults, a state that cannot be written is simply not saved.
 */
class StateStore {
  public:
    explicit StateStore(std::filesystem::path file);

    const std::filesystem::path& path() const { return file_; }

    /**
     * @brief Read the state file, or defaults when it is missing or invalid.
     */
    ProgressionState load(std::time_t now) const;

    /**
     * @brief Write @p state atomically (temporary file plus rename).
     *
     * Creates the parent directory when needed.
     */
    bool save(const ProgressionState& state) const;

    /**
     * @brief Locked read-modify-write.
     *
     * Holds an in-process mutex and an exclusive `flock` on `<file>.lock`
     * while re-reading the file, applying @p fn and writing the result.
     *
     * @param fn    Mutation applied to the freshly loaded state.
     * @param now   Time used for defaults when the file is unreadable.
     * @param saved Optional output set to whether the write succeeded.
     * @return The state as written (or as it would have been).
     */
    ProgressionState update(const std::function<void(ProgressionState&)>& fn, std::time_t now,
                            bool* saved = nullptr) const;

    /**
     * @brief Delete the state file. A missing file counts as success.
     */
    bool reset() const;

    /**
     * @brief `~/.gitpet/state.json`, or `.gitpet/state.json` relative to the
     * current directory when no home directory is known.
     */
    static std::filesystem::path default_path();

  private:
    std::filesystem::path file_;

    std::filesystem::path lock_path() const;
};

} // namespace gitpet

#endif // STATE_STORE_HPP
