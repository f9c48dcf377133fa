/**
 * @file transfersettings.h
 * @brief Persistent transfer preferences (retry policy and conflict defaults).
 */

#ifndef TRANSFERSETTINGS_H
#define TRANSFERSETTINGS_H

#include <QObject>
#include <QString>

#include "circuitbreaker.h"

/**
 * @brief What to do when a file with the same name exists at the destination.
 */
enum class FileExistsAction {
    Ask,
    Overwrite,
    Resume,               ///< Treated as Overwrite
    Skip,
    Rename,               ///< "name (n).ext"
    OverwriteIfNewer,
    OverwriteIfDifferent,
    SkipIfIdentical
};

/**
 * @brief What to do when a folder with the same name exists at the destination.
 */
enum class FolderExistsAction {
    Ask,
    MergeOverwrite,
    MergeSkipExisting,
    Replace,
    Skip
};

[[nodiscard]] QString fileExistsActionToString(FileExistsAction action);
[[nodiscard]] QString folderExistsActionToString(FolderExistsAction action);

/// @return true and sets @p action when @p text names a known action.
bool fileExistsActionFromString(const QString &text, FileExistsAction *action);
bool folderExistsActionFromString(const QString &text, FolderExistsAction *action);

/**
 * @brief Transfer preferences backed by QSettings.
 *
 * Keys live under the "transfers/" group. Values that are missing, malformed
 * or out of range fall back to their defaults with a warning, so a corrupted
 * settings file never prevents a transfer from starting.
 */
class TransferSettings : public QObject
{
    Q_OBJECT

public:
    static constexpr int MaxConsecutiveErrorsLimit = 100;
    static constexpr int MaxRetriesPerFileLimit = 20;
    static constexpr int MaxRetryDelayLimitMs = 600000;

    explicit TransferSettings(QObject *parent = nullptr);
    ~TransferSettings() override = default;

    [[nodiscard]] CircuitBreakerConfig breakerConfig() const { return breakerConfig_; }
    [[nodiscard]] FileExistsAction fileExistsAction() const { return fileExistsAction_; }
    [[nodiscard]] FolderExistsAction folderExistsAction() const { return folderExistsAction_; }

    void setBreakerConfig(const CircuitBreakerConfig &config);
    void setMaxRetriesPerFile(int retries);
    void setFileExistsAction(FileExistsAction action);
    void setFolderExistsAction(FolderExistsAction action);

    /// Re-reads every key from QSettings.
    void loadSettings();

    /// Writes every key to QSettings.
    void saveSettings() const;

signals:
    void settingsChanged();

private:
    CircuitBreakerConfig breakerConfig_;
    FileExistsAction fileExistsAction_ = FileExistsAction::Ask;
    FolderExistsAction folderExistsAction_ = FolderExistsAction::Ask;
};

#endif // TRANSFERSETTINGS_H
