#pragma once

#include <QMainWindow>
#include "core/automation/ClickEngine.hpp"
#include "core/io/ShortcutEngine.hpp"

class QComboBox;
class QDoubleSpinBox;
class QLabel;
class QPushButton;
class QSlider;

namespace kclick {

// Settings window class
class SettingsWindow : public QMainWindow {
    Q_OBJECT

public:
    SettingsWindow(automation::ClickEngine& clickEngine,
                   io::ShortcutEngine& shortcutEngine,
                   QWidget* parent = nullptr);
    ~SettingsWindow() override;

    [[nodiscard]] QString statusText() const;
    [[nodiscard]] QString shortcutText() const;
    [[nodiscard]] QString hintText() const;
    [[nodiscard]] bool isStartStopShown() const;

    void refresh();

protected:
    void enterEvent(QEnterEvent* event) override;
    void leaveEvent(QEvent* event) override;

private:
    void setupUI();
    void updateStatus();
    void updateShortcut();
    void updateMode();
    void updateRate();

    automation::ClickEngine& clickEngine;
    io::ShortcutEngine& shortcutEngine;

    QLabel* statusLabel = nullptr;
    QComboBox* modeCombo = nullptr;
    QSlider* rateSlider = nullptr;
    QDoubleSpinBox* rateSpin = nullptr;
    QPushButton* shortcutButton = nullptr;
    QLabel* hintLabel = nullptr;
    QPushButton* startStopButton = nullptr;
    QLabel* holdLabel = nullptr;
};

} // namespace kclick
