/**
 * @file batchcontext.h
 * @brief Per-batch state owned by BatchRunner.
 */

#ifndef BATCHCONTEXT_H
#define BATCHCONTEXT_H

#include <QDateTime>
#include <QHash>
#include <QList>
#include <QSet>
#include <QString>
#include <QStringList>

#include <functional>
#include <optional>

#include "foldermergenegotiator.h"
#include "models/transferqueue.h"
#include "overwritenegotiator.h"
#include "remoteentry.h"

/**
 * @brief One entry of a batch as selected in the source panel.
 */
struct TransferRequest {
    QString name;
    QString sourcePath;
    qint64 size = 0;
    QDateTime modified;
    bool isFolder = false;
};

Q_DECLARE_METATYPE(TransferRequest)

/**
 * @brief State that lives exactly as long as one batch.
 *
 * Cancel flags, the retry registry, apply-to-all answers and resume counters
 * are kept here instead of on the runner so that nothing leaks from one batch
 * into the next.
 */
struct BatchContext {
    enum CancelLevel { CancelNone = 0, CancelSoft = 1, CancelHard = 2 };

    int batchId = -1;
    TransferDirection direction = TransferDirection::Upload;
    QString destinationDirectory;
    QList<RemoteEntry> destinationEntries;

    QStringList itemIds;                      // Processing order
    QHash<QString, TransferRequest> requests; // Keyed by queue item id
    int cursor = 0;                           // Index into itemIds

    // Cancellation: the flag gates iteration boundaries, the level gates
    // in-flight calls
    bool softCancel = false;
    int cancelLevel = CancelNone;

    QHash<QString, std::function<void()>> retryClosures;
    QSet<QString> userRetries;  // Items the user retried while this batch ran

    // Items whose conflict check already ran; a retry skips straight to the transport
    QHash<QString, MergePolicy> resolvedItems;

    std::optional<OverwriteDecision> overwriteForAll;
    std::optional<FolderMergeDecision> folderMergeForAll;

    QHash<int, int> resumeCounts;  // Queue index -> resumes targeting it
    int reconnectedAtIndex = -1;   // Index that already had an automatic reconnect

    [[nodiscard]] bool isCancelled() const { return softCancel || cancelLevel != CancelNone; }

    [[nodiscard]] QString currentItemId() const {
        return cursor >= 0 && cursor < itemIds.size() ? itemIds.at(cursor) : QString();
    }

    /// Items after the current one that have not been processed yet.
    [[nodiscard]] int remainingAfterCursor() const {
        return qMax(0, itemIds.size() - cursor - 1);
    }

    [[nodiscard]] std::optional<RemoteEntry> destinationEntry(const QString &name) const {
        for (const auto &entry : destinationEntries) {
            if (entry.name == name) {
                return entry;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] QStringList destinationNames() const {
        QStringList names;
        names.reserve(destinationEntries.size());
        for (const auto &entry : destinationEntries) {
            names.append(entry.name);
        }
        return names;
    }

    /// Records an entry that now exists at the destination.
    void addDestinationEntry(const RemoteEntry &entry) {
        for (auto &existing : destinationEntries) {
            if (existing.name == entry.name) {
                existing = entry;
                return;
            }
        }
        destinationEntries.append(entry);
    }
};

#endif // BATCHCONTEXT_H
