/**
 * @file batchcommand.h
 * @brief Runs one upload or download batch for the command-line client.
 */

#ifndef BATCHCOMMAND_H
#define BATCHCOMMAND_H

#include <QObject>
#include <QStringList>
#include <QTextStream>
#include <QUrl>

#include "models/transferqueue.h"
#include "services/batchrunner.h"
#include "services/connectionparams.h"
#include "services/foldermergenegotiator.h"
#include "services/navigationsyncengine.h"
#include "services/overwritenegotiator.h"

class ErrorHandler;
class ITransportAdapter;
class PanelNavigator;
class SessionManager;
class TransferService;
class TransferSettings;

struct BatchCommandOptions {
    TransferDirection direction = TransferDirection::Upload;
    QUrl endpoint;
    QString localDirectory;
    QString remoteDirectory;  ///< Empty keeps the endpoint's initial path
    QStringList names;
    bool interactive = true;  ///< Ask on stdin; otherwise skip conflicts and cancel pauses
};

/**
 * @brief Drives the engine through connect, navigate, transfer and report.
 *
 * The command plays the part a main window plays in the desktop client: it
 * owns the session manager and panels, answers conflict prompts and breaker
 * pauses (from stdin, or with fixed answers when not interactive) and prints
 * one line per finished item followed by a batch summary.
 *
 * Exit codes: 0 when every item completed or was skipped, 1 when the batch
 * finished with failed or stopped items, 2 for setup errors and 3 when the
 * endpoint could not be reached.
 */
class BatchCommand : public QObject
{
    Q_OBJECT

public:
    static constexpr int ExitSuccess = 0;
    static constexpr int ExitIncomplete = 1;
    static constexpr int ExitSetupError = 2;
    static constexpr int ExitConnectionError = 3;

    BatchCommand(const BatchCommandOptions &options, TransferSettings *settings,
                 QObject *parent = nullptr);
    ~BatchCommand() override;

    /// Starts connecting. finished() is emitted exactly once.
    void start();

    /// Creates the adapter for an endpoint, or nullptr if none is available.
    [[nodiscard]] static ITransportAdapter *createAdapter(const ConnectionParams &params);

signals:
    void finished(int exitCode);

private slots:
    void onSessionRefreshed(const QString &id);
    void onSessionConnectFailed(const QString &id, const QString &message);
    void onRemoteListingChanged();
    void onNavigationFailed(Panel panel, const QString &path, const QString &message);
    void onOverwriteDecisionNeeded(const OverwriteQuery &query);
    void onFolderMergeDecisionNeeded(const FolderMergeQuery &query);
    void onPauseRequested(const PauseInfo &info);
    void onItemFinished(const QString &itemId, TransferItem::Status status);
    void onBatchFinished(const BatchSummary &summary);

private:
    enum class Step { Idle, Connecting, Navigating, Transferring, Done };

    void startTransfer();
    void fail(int exitCode, const QString &message);
    void finish(int exitCode);
    [[nodiscard]] QString ask(const QString &question);

    BatchCommandOptions options_;
    TransferSettings *settings_ = nullptr;
    ErrorHandler *errors_ = nullptr;
    PanelNavigator *navigator_ = nullptr;
    SessionManager *sessions_ = nullptr;
    TransferService *service_ = nullptr;

    Step step_ = Step::Idle;
    QTextStream out_;
    QTextStream err_;
    QTextStream in_;
};

#endif // BATCHCOMMAND_H
