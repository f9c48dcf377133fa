#include "connectionparams.h"

#include <QDir>

QString protocolName(const ConnectionParams &params)
{
    return std::visit(Overloaded{
        [](const FtpParams &p) { return p.secure ? QStringLiteral("ftps") : QStringLiteral("ftp"); },
        [](const SftpParams &) { return QStringLiteral("sftp"); },
        [](const S3Params &) { return QStringLiteral("s3"); },
        [](const WebDavParams &) { return QStringLiteral("webdav"); },
        [](const OAuthParams &p) { return QStringLiteral("oauth:%1").arg(p.provider); },
        [](const LocalMountParams &) { return QStringLiteral("local"); },
    }, params);
}

QString endpointLabel(const ConnectionParams &params)
{
    return std::visit(Overloaded{
        [](const FtpParams &p) {
            const QString hostPart = p.port == FtpParams::DefaultPort
                ? p.host : QStringLiteral("%1:%2").arg(p.host).arg(p.port);
            return p.user.isEmpty() ? hostPart : QStringLiteral("%1@%2").arg(p.user, hostPart);
        },
        [](const SftpParams &p) {
            const QString hostPart = p.port == SftpParams::DefaultPort
                ? p.host : QStringLiteral("%1:%2").arg(p.host).arg(p.port);
            return QStringLiteral("%1@%2").arg(p.user, hostPart);
        },
        [](const S3Params &p) {
            return p.endpoint.isEmpty() ? QStringLiteral("s3://%1").arg(p.bucket)
                                        : QStringLiteral("%1/%2").arg(p.endpoint, p.bucket);
        },
        [](const WebDavParams &p) { return p.url.toString(QUrl::RemoveUserInfo); },
        [](const OAuthParams &p) {
            return p.accountLabel.isEmpty() ? p.provider
                                            : QStringLiteral("%1 (%2)").arg(p.provider, p.accountLabel);
        },
        [](const LocalMountParams &p) { return QDir::toNativeSeparators(p.rootPath); },
    }, params);
}

QString initialRemotePath(const ConnectionParams &params)
{
    return std::visit(Overloaded{
        [](const FtpParams &p) { return p.initialPath.isEmpty() ? QStringLiteral("/") : p.initialPath; },
        [](const SftpParams &p) { return p.initialPath.isEmpty() ? QStringLiteral("/") : p.initialPath; },
        [](const S3Params &p) { return p.prefix.isEmpty() ? QStringLiteral("/") : QStringLiteral("/") + p.prefix; },
        [](const WebDavParams &) { return QStringLiteral("/"); },
        [](const OAuthParams &) { return QStringLiteral("/"); },
        [](const LocalMountParams &) { return QStringLiteral("/"); },
    }, params);
}

QString validateConnectionParams(const ConnectionParams &params)
{
    return std::visit(Overloaded{
        [](const FtpParams &p) -> QString {
            if (p.host.trimmed().isEmpty()) return QStringLiteral("No host configured");
            if (p.port == 0) return QStringLiteral("Invalid port");
            return QString();
        },
        [](const SftpParams &p) -> QString {
            if (p.host.trimmed().isEmpty()) return QStringLiteral("No host configured");
            if (p.user.trimmed().isEmpty()) return QStringLiteral("SFTP requires a user name");
            if (!p.password && !p.privateKeyPath) {
                return QStringLiteral("SFTP requires a password or a private key");
            }
            return QString();
        },
        [](const S3Params &p) -> QString {
            if (p.bucket.trimmed().isEmpty()) return QStringLiteral("No bucket configured");
            if (p.accessKeyId.isEmpty() || p.secretAccessKey.isEmpty()) {
                return QStringLiteral("S3 requires an access key and a secret key");
            }
            return QString();
        },
        [](const WebDavParams &p) -> QString {
            if (!p.url.isValid() || p.url.host().isEmpty()) return QStringLiteral("Invalid WebDAV URL");
            return QString();
        },
        [](const OAuthParams &p) -> QString {
            if (p.provider.trimmed().isEmpty()) return QStringLiteral("No provider selected");
            return QString();
        },
        [](const LocalMountParams &p) -> QString {
            if (p.rootPath.isEmpty()) return QStringLiteral("No root directory configured");
            if (!QDir(p.rootPath).exists()) {
                return QStringLiteral("Root directory does not exist: %1").arg(p.rootPath);
            }
            return QString();
        },
    }, params);
}

std::optional<ConnectionParams> connectionParamsFromUrl(const QUrl &url, QString *error)
{
    auto fail = [error](const QString &message) -> std::optional<ConnectionParams> {
        if (error) {
            *error = message;
        }
        return std::nullopt;
    };

    if (!url.isValid()) {
        return fail(QStringLiteral("Invalid URL: %1").arg(url.errorString()));
    }

    const QString scheme = url.scheme().toLower();
    const QString path = url.path().isEmpty() ? QStringLiteral("/") : url.path();

    if (scheme == QLatin1String("ftp") || scheme == QLatin1String("ftps")) {
        FtpParams p;
        p.host = url.host();
        p.port = static_cast<quint16>(url.port(FtpParams::DefaultPort));
        p.user = url.userName();
        p.password = url.password();
        p.secure = scheme == QLatin1String("ftps");
        p.initialPath = path;
        return ConnectionParams(p);
    }
    if (scheme == QLatin1String("sftp")) {
        SftpParams p;
        p.host = url.host();
        p.port = static_cast<quint16>(url.port(SftpParams::DefaultPort));
        p.user = url.userName();
        if (!url.password().isEmpty()) {
            p.password = url.password();
        }
        p.initialPath = path;
        return ConnectionParams(p);
    }
    if (scheme == QLatin1String("webdav") || scheme == QLatin1String("dav")
        || scheme == QLatin1String("davs")) {
        WebDavParams p;
        QUrl httpUrl(url);
        httpUrl.setScheme(scheme == QLatin1String("davs") ? QStringLiteral("https")
                                                          : QStringLiteral("http"));
        p.user = url.userName();
        p.password = url.password();
        httpUrl.setUserInfo(QString());
        p.url = httpUrl;
        return ConnectionParams(p);
    }
    if (scheme == QLatin1String("s3")) {
        S3Params p;
        p.bucket = url.host();
        p.accessKeyId = url.userName();
        p.secretAccessKey = url.password();
        p.prefix = path.mid(1);
        return ConnectionParams(p);
    }
    if (scheme == QLatin1String("file")) {
        LocalMountParams p;
        p.rootPath = url.toLocalFile();
        if (p.rootPath.isEmpty()) {
            return fail(QStringLiteral("file URL has no path"));
        }
        return ConnectionParams(p);
    }

    return fail(QStringLiteral("Unsupported scheme: %1").arg(url.scheme()));
}
