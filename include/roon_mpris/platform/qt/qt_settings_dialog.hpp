#pragma once

#include "roon_mpris/core/models.hpp"
#include <QCheckBox>
#include <QComboBox>
#include <QDialog>
#include <QLineEdit>
#include <QSpinBox>
#include <filesystem>

namespace roon_mpris::platform::qt {

class QtSettingsDialog : public QDialog {
    Q_OBJECT

public:
    QtSettingsDialog(const core::ApplicationConfig& config, std::filesystem::path log_directory,
                     QWidget* parent = nullptr);
    ~QtSettingsDialog() override = default;

    core::ApplicationConfig get_config() const;

private:
    void setup_ui();
    void load_config(const core::ApplicationConfig& config);

    void on_accept();
    void on_reset_defaults();
    bool validate_inputs();
    void open_logs_folder();

private:
    // General
    QComboBox* m_log_level_combo = nullptr;

    // Roon
    QLineEdit* m_zone_name_edit = nullptr;
    QLineEdit* m_output_id_edit = nullptr;
    QLineEdit* m_host_edit = nullptr;
    QSpinBox* m_port_spin = nullptr;
    QCheckBox* m_log_traffic_check = nullptr;

    // MPRIS
    QLineEdit* m_identity_edit = nullptr;
    QCheckBox* m_map_can_play_check = nullptr;

    // Notifications
    QCheckBox* m_notifications_enabled_check = nullptr;
    QCheckBox* m_require_artwork_check = nullptr;
    QLineEdit* m_artwork_path_edit = nullptr;

    core::ApplicationConfig m_original_config;
    std::filesystem::path m_log_directory;
};

} // namespace roon_mpris::platform::qt
