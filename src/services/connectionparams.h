/**
 * @file connectionparams.h
 * @brief Protocol-tagged connection parameters for remote endpoints.
 *
 * Each protocol carries only the fields it needs. Code that branches on
 * protocol uses std::visit so a new alternative fails to compile until
 * every branch handles it.
 */

#ifndef CONNECTIONPARAMS_H
#define CONNECTIONPARAMS_H

#include <QMetaType>
#include <QString>
#include <QUrl>

#include <optional>
#include <variant>

struct FtpParams {
    static constexpr quint16 DefaultPort = 21;

    QString host;
    quint16 port = DefaultPort;
    QString user;
    QString password;
    bool secure = false;  ///< Explicit FTPS (AUTH TLS)
    QString initialPath = QStringLiteral("/");
};

struct SftpParams {
    static constexpr quint16 DefaultPort = 22;

    QString host;
    quint16 port = DefaultPort;
    QString user;
    std::optional<QString> password;
    std::optional<QString> privateKeyPath;
    QString initialPath = QStringLiteral("/");
};

struct S3Params {
    QString endpoint;  ///< Empty means the provider's default endpoint
    QString region;
    QString bucket;
    QString accessKeyId;
    QString secretAccessKey;
    bool pathStyle = false;
    QString prefix;
};

struct WebDavParams {
    QUrl url;
    QString user;
    QString password;
};

struct OAuthParams {
    QString provider;       ///< e.g. "googledrive", "dropbox", "onedrive"
    QString accountLabel;
    QString rootFolderId;
};

/// A directory on this machine (or a mounted share) treated as the endpoint.
struct LocalMountParams {
    QString rootPath;
};

using ConnectionParams = std::variant<FtpParams,
                                      SftpParams,
                                      S3Params,
                                      WebDavParams,
                                      OAuthParams,
                                      LocalMountParams>;

/// Helper for building exhaustive std::visit overload sets.
template<class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

/// Short lowercase protocol tag ("ftp", "ftps", "sftp", "s3", "webdav", "oauth:<provider>", "local").
[[nodiscard]] QString protocolName(const ConnectionParams &params);

/// Human-readable endpoint label used for session tabs and log lines.
[[nodiscard]] QString endpointLabel(const ConnectionParams &params);

/// Directory to show first after connecting.
[[nodiscard]] QString initialRemotePath(const ConnectionParams &params);

/**
 * @brief Checks required fields for the selected protocol.
 * @return Empty string when valid, otherwise a description of the problem.
 */
[[nodiscard]] QString validateConnectionParams(const ConnectionParams &params);

/**
 * @brief Parses an endpoint URL into connection parameters.
 *
 * Supported schemes: ftp, ftps, sftp, webdav/dav (http), davs (https),
 * s3 (bucket as host, prefix as path) and file.
 *
 * @param url The endpoint URL.
 * @param error Receives a description when parsing fails.
 * @return The parameters, or std::nullopt for an unsupported URL.
 */
[[nodiscard]] std::optional<ConnectionParams> connectionParamsFromUrl(const QUrl &url,
                                                                      QString *error = nullptr);

Q_DECLARE_METATYPE(ConnectionParams)

#endif // CONNECTIONPARAMS_H
