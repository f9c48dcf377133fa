/**
 * @file overwritenegotiator.h
 * @brief File-level conflict resolution before a transfer begins.
 */

#ifndef OVERWRITENEGOTIATOR_H
#define OVERWRITENEGOTIATOR_H

#include <QDateTime>
#include <QObject>
#include <QStringList>

#include <functional>
#include <optional>

#include "remoteentry.h"
#include "transfersettings.h"

struct BatchContext;

enum class OverwriteAction { Overwrite, Skip, Rename, Cancel };

[[nodiscard]] const char *overwriteActionToString(OverwriteAction action);

struct OverwriteDecision {
    OverwriteAction action = OverwriteAction::Overwrite;
    bool applyToAll = false;
    QString newName;  ///< Only meaningful for Rename
};

/**
 * @brief Everything the user needs to decide about one conflicting file.
 */
struct OverwriteQuery {
    QString itemId;
    QString filename;
    qint64 size = 0;
    QDateTime modified;
    bool sourceIsRemote = false;
    int remainingQueueCount = 0;

    /// Same-named file in the destination listing, if any
    std::optional<RemoteEntry> destination;

    /// Every name present in the destination directory
    QStringList destinationNames;
};

Q_DECLARE_METATYPE(OverwriteQuery)

/**
 * @brief Decides whether a file may overwrite an existing destination file.
 *
 * resolve() answers immediately when the destination has no such file, when
 * an earlier "apply to all" answer exists in the batch, or when a default
 * action other than Ask is configured. Otherwise it emits
 * overwriteDecisionNeeded() and the batch waits until respond() is called.
 *
 * A same-named folder at the destination is never overwritten. Only a Skip
 * or Rename default (or remembered answer) settles it without a prompt, and
 * an Overwrite answer to that prompt is turned into a Rename.
 *
 * Only one query can be pending at a time.
 */
class OverwriteNegotiator : public QObject
{
    Q_OBJECT

public:
    using DecisionCallback = std::function<void(const OverwriteDecision &)>;

    /// Timestamps within this distance are considered equal.
    static constexpr qint64 TimestampToleranceMs = 1000;

    explicit OverwriteNegotiator(QObject *parent = nullptr);

    void setDefaultAction(FileExistsAction action) { defaultAction_ = action; }
    [[nodiscard]] FileExistsAction defaultAction() const { return defaultAction_; }

    /**
     * @brief Resolves @p query, invoking @p callback once with the decision.
     *
     * The callback may run before resolve() returns. @p context must outlive
     * the pending query; the runner calls cancelPending() before dropping it.
     */
    void resolve(const OverwriteQuery &query, BatchContext &context, DecisionCallback callback);

    /**
     * @brief Answers the pending prompt.
     * @return false if no prompt is pending.
     */
    bool respond(const OverwriteDecision &decision);

    /// Resolves a pending prompt as Cancel. No-op when nothing is pending.
    void cancelPending();

    [[nodiscard]] bool isAwaitingDecision() const { return static_cast<bool>(pendingCallback_); }
    [[nodiscard]] OverwriteQuery pendingQuery() const { return pendingQuery_; }

signals:
    void overwriteDecisionNeeded(const OverwriteQuery &query);

private:
    [[nodiscard]] std::optional<OverwriteDecision> decideFromDefault(const OverwriteQuery &query) const;
    [[nodiscard]] OverwriteDecision finalizeRename(OverwriteDecision decision,
                                                   const OverwriteQuery &query) const;

    FileExistsAction defaultAction_ = FileExistsAction::Ask;
    OverwriteQuery pendingQuery_;
    BatchContext *pendingContext_ = nullptr;
    DecisionCallback pendingCallback_;
};

#endif // OVERWRITENEGOTIATOR_H
