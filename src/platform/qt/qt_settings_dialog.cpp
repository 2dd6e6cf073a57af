#include "roon_mpris/platform/qt/qt_settings_dialog.hpp"
#include "roon_mpris/utils/logger.hpp"
#include <QDesktopServices>
#include <QDialogButtonBox>
#include <QFormLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QMessageBox>
#include <QPushButton>
#include <QUrl>
#include <QVBoxLayout>

namespace roon_mpris::platform::qt {

QtSettingsDialog::QtSettingsDialog(const core::ApplicationConfig& config, std::filesystem::path log_directory,
                                   QWidget* parent)
    : QDialog(parent), m_original_config(config), m_log_directory(std::move(log_directory)) {
    setWindowTitle("Settings - Roon MPRIS");
    setMinimumWidth(480);
    setup_ui();
    load_config(config);
}

void QtSettingsDialog::setup_ui() {
    auto* main_layout = new QVBoxLayout(this);

    // General Settings
    auto* general_group = new QGroupBox("General");
    auto* general_form = new QFormLayout(general_group);

    m_log_level_combo = new QComboBox();
    m_log_level_combo->addItems({"Debug", "Info", "Warning", "Error", "None"});
    general_form->addRow("Log Level:", m_log_level_combo);

    auto* logs_button = new QPushButton("Open Logs Folder");
    connect(logs_button, &QPushButton::clicked, this, &QtSettingsDialog::open_logs_folder);
    general_form->addRow("Logs:", logs_button);

    main_layout->addWidget(general_group);

    // Roon
    auto* roon_group = new QGroupBox("Roon");
    auto* roon_form = new QFormLayout(roon_group);

    m_zone_name_edit = new QLineEdit();
    m_zone_name_edit->setPlaceholderText("Zone display name, e.g. Living Room");
    roon_form->addRow("Zone:", m_zone_name_edit);

    m_output_id_edit = new QLineEdit();
    m_output_id_edit->setPlaceholderText("Filled in when the zone is picked in Roon");
    roon_form->addRow("Output ID:", m_output_id_edit);

    m_host_edit = new QLineEdit();
    m_host_edit->setPlaceholderText("Leave empty to discover the core");
    roon_form->addRow("Core Host:", m_host_edit);

    m_port_spin = new QSpinBox();
    m_port_spin->setRange(1, 65535);
    roon_form->addRow("Core Port:", m_port_spin);

    m_log_traffic_check = new QCheckBox("Log Roon protocol traffic");
    roon_form->addRow(m_log_traffic_check);

    main_layout->addWidget(roon_group);

    // MPRIS
    auto* mpris_group = new QGroupBox("Media Player");
    auto* mpris_form = new QFormLayout(mpris_group);

    m_identity_edit = new QLineEdit();
    mpris_form->addRow("Identity:", m_identity_edit);

    m_map_can_play_check = new QCheckBox("Report Roon's play permission (may hide the player in some docks)");
    mpris_form->addRow(m_map_can_play_check);

    main_layout->addWidget(mpris_group);

    // Notifications
    auto* notify_group = new QGroupBox("Notifications");
    auto* notify_form = new QFormLayout(notify_group);

    m_notifications_enabled_check = new QCheckBox("Show a notification when a track starts");
    notify_form->addRow(m_notifications_enabled_check);

    m_require_artwork_check = new QCheckBox("Only notify when cover art is available");
    notify_form->addRow(m_require_artwork_check);

    m_artwork_path_edit = new QLineEdit();
    notify_form->addRow("Artwork File:", m_artwork_path_edit);

    connect(m_notifications_enabled_check, &QCheckBox::toggled, this, [this](bool enabled) {
        m_require_artwork_check->setEnabled(enabled);
        m_artwork_path_edit->setEnabled(enabled);
    });

    main_layout->addWidget(notify_group);
    main_layout->addStretch();

    // Buttons
    auto* button_layout = new QHBoxLayout();

    auto* reset_button = new QPushButton("Reset to Defaults");
    connect(reset_button, &QPushButton::clicked, this, &QtSettingsDialog::on_reset_defaults);
    button_layout->addWidget(reset_button);
    button_layout->addStretch();

    auto* button_box = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel);
    connect(button_box, &QDialogButtonBox::accepted, this, &QtSettingsDialog::on_accept);
    connect(button_box, &QDialogButtonBox::rejected, this, &QDialog::reject);
    button_layout->addWidget(button_box);

    main_layout->addLayout(button_layout);
}

void QtSettingsDialog::load_config(const core::ApplicationConfig& config) {
    m_log_level_combo->setCurrentIndex(static_cast<int>(config.log_level));

    m_zone_name_edit->setText(config.zone ? QString::fromStdString(config.zone->name) : QString());
    m_output_id_edit->setText(config.zone ? QString::fromStdString(config.zone->output_id) : QString());
    m_host_edit->setText(QString::fromStdString(config.roon.host));
    m_port_spin->setValue(config.roon.port);
    m_log_traffic_check->setChecked(config.roon.log_traffic);

    m_identity_edit->setText(QString::fromStdString(config.mpris.identity));
    m_map_can_play_check->setChecked(config.mpris.map_can_play);

    m_notifications_enabled_check->setChecked(config.notifications.enabled);
    m_require_artwork_check->setChecked(config.notifications.require_artwork);
    m_artwork_path_edit->setText(QString::fromStdString(config.notifications.artwork_path));
    m_require_artwork_check->setEnabled(config.notifications.enabled);
    m_artwork_path_edit->setEnabled(config.notifications.enabled);
}

core::ApplicationConfig QtSettingsDialog::get_config() const {
    core::ApplicationConfig config = m_original_config;

    config.log_level = static_cast<utils::LogLevel>(m_log_level_combo->currentIndex());

    QString zone_name = m_zone_name_edit->text().trimmed();
    if (zone_name.isEmpty()) {
        config.zone.reset();
    } else {
        core::ZoneSelection zone;
        zone.name = zone_name.toStdString();
        // A renamed zone no longer matches the output Roon picked for the old one
        if (!m_original_config.zone || m_original_config.zone->name == zone.name) {
            zone.output_id = m_output_id_edit->text().trimmed().toStdString();
        }
        config.zone = zone;
    }

    config.roon.host = m_host_edit->text().trimmed().toStdString();
    config.roon.port = m_port_spin->value();
    config.roon.log_traffic = m_log_traffic_check->isChecked();

    config.mpris.identity = m_identity_edit->text().trimmed().toStdString();
    config.mpris.map_can_play = m_map_can_play_check->isChecked();

    config.notifications.enabled = m_notifications_enabled_check->isChecked();
    config.notifications.require_artwork = m_require_artwork_check->isChecked();
    config.notifications.artwork_path = m_artwork_path_edit->text().trimmed().toStdString();

    return config;
}

void QtSettingsDialog::on_accept() {
    if (validate_inputs()) {
        accept();
    }
}

void QtSettingsDialog::on_reset_defaults() {
    auto result = QMessageBox::question(
        this,
        "Reset to Defaults",
        "Are you sure you want to reset all settings to their default values?",
        QMessageBox::Yes | QMessageBox::No
    );

    if (result == QMessageBox::Yes) {
        load_config(core::ApplicationConfig{});
    }
}

bool QtSettingsDialog::validate_inputs() {
    if (m_identity_edit->text().trimmed().isEmpty()) {
        LOG_WARNING("SettingsDialog", "Player identity is empty, using default");
        m_identity_edit->setText(QString::fromStdString(core::MprisConfig{}.identity));
    }
    if (m_artwork_path_edit->text().trimmed().isEmpty()) {
        LOG_WARNING("SettingsDialog", "Artwork path is empty, using default");
        m_artwork_path_edit->setText(QString::fromStdString(core::NotificationConfig{}.artwork_path));
    }

    if (!get_config().is_valid()) {
        QMessageBox::warning(this, "Invalid Settings", "Some settings are invalid. Please check the values.");
        return false;
    }
    return true;
}

void QtSettingsDialog::open_logs_folder() {
    if (m_log_directory.empty()) {
        return;
    }

    std::error_code ec;
    std::filesystem::create_directories(m_log_directory, ec);
    QDesktopServices::openUrl(QUrl::fromLocalFile(QString::fromStdString(m_log_directory.string())));
}

} // namespace roon_mpris::platform::qt
