#include "roon_mpris/services/roon/pairing_store.hpp"
#include "roon_mpris/utils/logger.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <mutex>

namespace roon_mpris {
namespace services {

PairingStore::PairingStore(std::filesystem::path storage_path)
    : m_storage_path(std::move(storage_path)) {
    load();
}

std::optional<std::string> PairingStore::get_token(const std::string& core_id) const {
    std::shared_lock lock(m_mutex);
    auto it = m_tokens.find(core_id);
    if (it == m_tokens.end()) {
        return std::nullopt;
    }
    return it->second;
}

void PairingStore::set_token(const std::string& core_id, const std::string& token) {
    {
        std::unique_lock lock(m_mutex);
        m_tokens[core_id] = token;
    }
    save();
}

std::optional<std::string> PairingStore::get_paired_core_id() const {
    std::shared_lock lock(m_mutex);
    if (m_paired_core_id.empty()) {
        return std::nullopt;
    }
    return m_paired_core_id;
}

void PairingStore::set_paired_core_id(const std::string& core_id) {
    {
        std::unique_lock lock(m_mutex);
        m_paired_core_id = core_id;
    }
    save();
}

void PairingStore::save() {
    std::shared_lock lock(m_mutex);
    save_internal();
}

void PairingStore::load() {
    std::unique_lock lock(m_mutex);
    load_internal();
}

void PairingStore::save_internal() {
    YAML::Node node;
    if (!m_paired_core_id.empty()) {
        node["paired_core_id"] = m_paired_core_id;
    }
    for (const auto& [core_id, token] : m_tokens) {
        node["tokens"][core_id] = token;
    }

    std::error_code ec;
    if (m_storage_path.has_parent_path()) {
        std::filesystem::create_directories(m_storage_path.parent_path(), ec);
    }

    std::ofstream file(m_storage_path);
    if (!file) {
        LOG_ERROR("PairingStore", "Failed to open " + m_storage_path.string() + " for writing");
        return;
    }

    file << node << '\n';
    LOG_DEBUG("PairingStore", "Saved pairing state");
}

void PairingStore::load_internal() {
    if (!std::filesystem::exists(m_storage_path)) {
        LOG_DEBUG("PairingStore", "No pairing state yet");
        return;
    }

    try {
        YAML::Node node = YAML::LoadFile(m_storage_path.string());

        if (node["paired_core_id"]) {
            m_paired_core_id = node["paired_core_id"].as<std::string>();
        }
        if (node["tokens"] && node["tokens"].IsMap()) {
            for (const auto& entry : node["tokens"]) {
                m_tokens[entry.first.as<std::string>()] = entry.second.as<std::string>();
            }
        }

        LOG_DEBUG("PairingStore", "Loaded " + std::to_string(m_tokens.size()) + " core token(s)");
    } catch (const YAML::Exception& e) {
        LOG_ERROR("PairingStore", "Error loading pairing state: " + std::string(e.what()));
    }
}

} // namespace services
} // namespace roon_mpris
