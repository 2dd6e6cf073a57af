#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>

namespace roon_mpris {
namespace services {

// roonstate.yaml: the registration token each core handed us, plus the
// last core we paired with.
class PairingStore {
public:
    explicit PairingStore(std::filesystem::path storage_path);
    ~PairingStore() = default;

    std::optional<std::string> get_token(const std::string& core_id) const;
    void set_token(const std::string& core_id, const std::string& token);

    std::optional<std::string> get_paired_core_id() const;
    void set_paired_core_id(const std::string& core_id);

    void save();
    void load();

    const std::filesystem::path& path() const { return m_storage_path; }

private:
    void save_internal();
    void load_internal();

    mutable std::shared_mutex m_mutex;
    std::filesystem::path m_storage_path;

    std::string m_paired_core_id;
    std::map<std::string, std::string> m_tokens;
};

} // namespace services
} // namespace roon_mpris
