#include "SettingsWindow.hpp"
#include <QComboBox>
#include <QDoubleSpinBox>
#include <QEnterEvent>
#include <QFormLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QPushButton>
#include <QSignalBlocker>
#include <QSlider>
#include <QVBoxLayout>
#include <algorithm>
#include <cmath>

namespace kclick {

using automation::ClickMode;

SettingsWindow::SettingsWindow(automation::ClickEngine& clickEngine,
                               io::ShortcutEngine& shortcutEngine,
                               QWidget* parent)
    : QMainWindow(parent), clickEngine(clickEngine), shortcutEngine(shortcutEngine) {
    setWindowTitle("KClick");
    setMinimumSize(340, 280);
    setupUI();

    clickEngine.setOnClickingChanged([this](bool) { updateStatus(); });
    clickEngine.setOnPausedChanged([this](bool) { updateStatus(); });
    shortcutEngine.setOnRecordingChanged([this](bool) { updateShortcut(); });
    shortcutEngine.setOnShortcutChanged([this](const std::optional<Shortcut>&) { updateShortcut(); });

    refresh();
}

SettingsWindow::~SettingsWindow() {
    clickEngine.setOnClickingChanged(nullptr);
    clickEngine.setOnPausedChanged(nullptr);
    shortcutEngine.setOnRecordingChanged(nullptr);
    shortcutEngine.setOnShortcutChanged(nullptr);
    clickEngine.setSuppressed(false);
}

void SettingsWindow::setupUI() {
    auto* centralWidget = new QWidget(this);
    setCentralWidget(centralWidget);

    auto* mainLayout = new QVBoxLayout(centralWidget);

    // Status
    statusLabel = new QLabel(this);
    statusLabel->setAlignment(Qt::AlignCenter);
    mainLayout->addWidget(statusLabel);

    // Clicking
    auto* clickGroup = new QGroupBox("Clicking", this);
    auto* clickLayout = new QFormLayout(clickGroup);

    modeCombo = new QComboBox(this);
    modeCombo->addItem("Toggle", static_cast<int>(ClickMode::Toggle));
    modeCombo->addItem("Hold", static_cast<int>(ClickMode::Hold));
    connect(modeCombo, &QComboBox::currentIndexChanged, this, [this](int index) {
        if (index < 0) return;
        clickEngine.setMode(static_cast<ClickMode>(modeCombo->itemData(index).toInt()));
        updateMode();
    });
    clickLayout->addRow("Mode", modeCombo);

    auto* rateRow = new QHBoxLayout();
    rateSlider = new QSlider(Qt::Horizontal, this);
    rateSlider->setRange(1, 100);
    rateSpin = new QDoubleSpinBox(this);
    rateSpin->setRange(1.0, 1000.0);
    rateSpin->setDecimals(1);
    rateSpin->setSuffix(" cps");
    connect(rateSlider, &QSlider::valueChanged, this, [this](int value) {
        clickEngine.setRate(value);
        updateRate();
    });
    connect(rateSpin, &QDoubleSpinBox::valueChanged, this, [this](double value) {
        clickEngine.setRate(value);
        updateRate();
    });
    rateRow->addWidget(rateSlider, 1);
    rateRow->addWidget(rateSpin);
    clickLayout->addRow("Clicks per second", rateRow);

    mainLayout->addWidget(clickGroup);

    // Shortcut
    auto* shortcutGroup = new QGroupBox("Hotkey", this);
    auto* shortcutLayout = new QVBoxLayout(shortcutGroup);

    shortcutButton = new QPushButton(this);
    shortcutButton->setToolTip("Click, then press a key combination or a mouse button");
    connect(shortcutButton, &QPushButton::clicked, this, [this]() {
        shortcutEngine.setRecording(!shortcutEngine.isRecording());
    });
    shortcutLayout->addWidget(shortcutButton);

    hintLabel = new QLabel(this);
    hintLabel->setStyleSheet("color: gray;");
    shortcutLayout->addWidget(hintLabel);

    mainLayout->addWidget(shortcutGroup);

    // Start / stop
    startStopButton = new QPushButton(this);
    connect(startStopButton, &QPushButton::clicked, this, [this]() {
        clickEngine.toggle();
    });
    mainLayout->addWidget(startStopButton);

    holdLabel = new QLabel("Hold hotkey to click", this);
    holdLabel->setAlignment(Qt::AlignCenter);
    mainLayout->addWidget(holdLabel);

    mainLayout->addStretch();
}

void SettingsWindow::refresh() {
    updateMode();
    updateRate();
    updateShortcut();
    updateStatus();
}

void SettingsWindow::updateStatus() {
    QString text;
    QString color;
    if (!clickEngine.isRunning()) {
        text = "Idle";
        color = "gray";
    } else if (clickEngine.isPausedExternally()) {
        text = "Paused";
        color = "orange";
    } else {
        text = "Active";
        color = "green";
    }
    statusLabel->setText(text);
    statusLabel->setStyleSheet(QString("font-size: 16px; font-weight: bold; color: %1;").arg(color));
    startStopButton->setText(clickEngine.isRunning() ? "Stop" : "Start");
}

void SettingsWindow::updateShortcut() {
    if (shortcutEngine.isRecording()) {
        shortcutButton->setText("Recording...");
    } else {
        shortcutButton->setText(QString::fromStdString(shortcutEngine.descriptor()));
    }
    hintLabel->setText(QString("Hold %1 to pause clicking")
                           .arg(QString::fromStdString(modifierName(shortcutEngine.pauseModifier()))));
}

void SettingsWindow::updateMode() {
    const bool toggle = clickEngine.mode() == ClickMode::Toggle;
    {
        QSignalBlocker blocker(modeCombo);
        modeCombo->setCurrentIndex(modeCombo->findData(static_cast<int>(clickEngine.mode())));
    }
    startStopButton->setVisible(toggle);
    holdLabel->setVisible(!toggle);
    updateStatus();
}

void SettingsWindow::updateRate() {
    const double rate = clickEngine.clicksPerSecond();
    QSignalBlocker sliderBlocker(rateSlider);
    QSignalBlocker spinBlocker(rateSpin);
    rateSlider->setValue(static_cast<int>(std::lround(std::min(rate, 100.0))));
    rateSpin->setValue(rate);
}

QString SettingsWindow::statusText() const {
    return statusLabel->text();
}

QString SettingsWindow::shortcutText() const {
    return shortcutButton->text();
}

QString SettingsWindow::hintText() const {
    return hintLabel->text();
}

bool SettingsWindow::isStartStopShown() const {
    return !startStopButton->isHidden();
}

void SettingsWindow::enterEvent(QEnterEvent* event) {
    clickEngine.setSuppressed(true);
    QMainWindow::enterEvent(event);
}

void SettingsWindow::leaveEvent(QEvent* event) {
    clickEngine.setSuppressed(false);
    QMainWindow::leaveEvent(event);
}

} // namespace kclick
