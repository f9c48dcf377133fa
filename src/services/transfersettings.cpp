/**
 * @file transfersettings.cpp
 * @brief Implementation of TransferSettings.
 */

#include "transfersettings.h"

#include <QDebug>
#include <QSettings>

namespace {

struct FileActionName {
    FileExistsAction action;
    const char *name;
};

constexpr FileActionName FileActionNames[] = {
    {FileExistsAction::Ask, "ask"},
    {FileExistsAction::Overwrite, "overwrite"},
    {FileExistsAction::Resume, "resume"},
    {FileExistsAction::Skip, "skip"},
    {FileExistsAction::Rename, "rename"},
    {FileExistsAction::OverwriteIfNewer, "overwrite_if_newer"},
    {FileExistsAction::OverwriteIfDifferent, "overwrite_if_different"},
    {FileExistsAction::SkipIfIdentical, "skip_if_identical"},
};

struct FolderActionName {
    FolderExistsAction action;
    const char *name;
};

constexpr FolderActionName FolderActionNames[] = {
    {FolderExistsAction::Ask, "ask"},
    {FolderExistsAction::MergeOverwrite, "merge_overwrite"},
    {FolderExistsAction::MergeSkipExisting, "merge_skip_existing"},
    {FolderExistsAction::Replace, "replace"},
    {FolderExistsAction::Skip, "skip"},
};

int readInt(const QSettings &settings, const char *key, int defaultValue, int min, int max)
{
    const QVariant value = settings.value(QLatin1String(key));
    if (!value.isValid()) {
        return defaultValue;
    }
    bool ok = false;
    const int parsed = value.toInt(&ok);
    if (!ok || parsed < min || parsed > max) {
        qWarning() << "TransferSettings: Invalid value" << value << "for" << key
                   << "- using default" << defaultValue;
        return defaultValue;
    }
    return parsed;
}

} // namespace

QString fileExistsActionToString(FileExistsAction action)
{
    for (const auto &entry : FileActionNames) {
        if (entry.action == action) {
            return QLatin1String(entry.name);
        }
    }
    return QStringLiteral("ask");
}

QString folderExistsActionToString(FolderExistsAction action)
{
    for (const auto &entry : FolderActionNames) {
        if (entry.action == action) {
            return QLatin1String(entry.name);
        }
    }
    return QStringLiteral("ask");
}

bool fileExistsActionFromString(const QString &text, FileExistsAction *action)
{
    const QString key = text.trimmed().toLower();
    for (const auto &entry : FileActionNames) {
        if (key == QLatin1String(entry.name)) {
            *action = entry.action;
            return true;
        }
    }
    return false;
}

bool folderExistsActionFromString(const QString &text, FolderExistsAction *action)
{
    const QString key = text.trimmed().toLower();
    for (const auto &entry : FolderActionNames) {
        if (key == QLatin1String(entry.name)) {
            *action = entry.action;
            return true;
        }
    }
    return false;
}

TransferSettings::TransferSettings(QObject *parent)
    : QObject(parent)
{
    loadSettings();
}

void TransferSettings::setBreakerConfig(const CircuitBreakerConfig &config)
{
    breakerConfig_ = config;
    emit settingsChanged();
}

void TransferSettings::setMaxRetriesPerFile(int retries)
{
    if (retries < 0 || retries > MaxRetriesPerFileLimit) {
        qWarning() << "TransferSettings: Ignoring out-of-range retry count" << retries;
        return;
    }
    breakerConfig_.maxRetriesPerFile = retries;
    emit settingsChanged();
}

void TransferSettings::setFileExistsAction(FileExistsAction action)
{
    fileExistsAction_ = action;
    emit settingsChanged();
}

void TransferSettings::setFolderExistsAction(FolderExistsAction action)
{
    folderExistsAction_ = action;
    emit settingsChanged();
}

void TransferSettings::loadSettings()
{
    QSettings settings;
    const CircuitBreakerConfig defaults;

    breakerConfig_.maxConsecutiveErrors = readInt(settings, "transfers/maxConsecutiveErrors",
        defaults.maxConsecutiveErrors, 1, MaxConsecutiveErrorsLimit);
    breakerConfig_.maxRetriesPerFile = readInt(settings, "transfers/maxRetriesPerFile",
        defaults.maxRetriesPerFile, 0, MaxRetriesPerFileLimit);
    breakerConfig_.baseRetryDelayMs = readInt(settings, "transfers/baseRetryDelayMs",
        defaults.baseRetryDelayMs, 0, MaxRetryDelayLimitMs);
    breakerConfig_.maxRetryDelayMs = readInt(settings, "transfers/maxRetryDelayMs",
        defaults.maxRetryDelayMs, 0, MaxRetryDelayLimitMs);
    if (breakerConfig_.maxRetryDelayMs < breakerConfig_.baseRetryDelayMs) {
        qWarning() << "TransferSettings: maxRetryDelayMs below baseRetryDelayMs, using defaults";
        breakerConfig_.baseRetryDelayMs = defaults.baseRetryDelayMs;
        breakerConfig_.maxRetryDelayMs = defaults.maxRetryDelayMs;
    }

    const QVariant multiplier = settings.value("transfers/backoffMultiplier");
    breakerConfig_.backoffMultiplier = defaults.backoffMultiplier;
    if (multiplier.isValid()) {
        bool ok = false;
        const double parsed = multiplier.toDouble(&ok);
        if (ok && parsed >= 1.0 && parsed <= 10.0) {
            breakerConfig_.backoffMultiplier = parsed;
        } else {
            qWarning() << "TransferSettings: Invalid backoffMultiplier" << multiplier
                       << "- using default" << defaults.backoffMultiplier;
        }
    }

    const QString fileAction = settings.value("transfers/fileExistsAction",
                                              QStringLiteral("ask")).toString();
    if (!fileExistsActionFromString(fileAction, &fileExistsAction_)) {
        qWarning() << "TransferSettings: Unknown fileExistsAction" << fileAction;
        fileExistsAction_ = FileExistsAction::Ask;
    }

    const QString folderAction = settings.value("transfers/folderExistsAction",
                                                QStringLiteral("ask")).toString();
    if (!folderExistsActionFromString(folderAction, &folderExistsAction_)) {
        qWarning() << "TransferSettings: Unknown folderExistsAction" << folderAction;
        folderExistsAction_ = FolderExistsAction::Ask;
    }
}

void TransferSettings::saveSettings() const
{
    QSettings settings;
    settings.setValue("transfers/maxConsecutiveErrors", breakerConfig_.maxConsecutiveErrors);
    settings.setValue("transfers/maxRetriesPerFile", breakerConfig_.maxRetriesPerFile);
    settings.setValue("transfers/baseRetryDelayMs", breakerConfig_.baseRetryDelayMs);
    settings.setValue("transfers/maxRetryDelayMs", breakerConfig_.maxRetryDelayMs);
    settings.setValue("transfers/backoffMultiplier", breakerConfig_.backoffMultiplier);
    settings.setValue("transfers/fileExistsAction", fileExistsActionToString(fileExistsAction_));
    settings.setValue("transfers/folderExistsAction",
                      folderExistsActionToString(folderExistsAction_));
}
