#include <QtCore/QFile>
#include <QtCore/QTextStream>
#include <QtCore/QMutex>
#include <QtCore/QMutexLocker>
#include <QtCore/QDebug>

#include <cstdio>
#include <memory>

#include "Logger.hpp"

Q_LOGGING_CATEGORY(appCore,  "todokeep.core")
Q_LOGGING_CATEGORY(appHttp,  "todokeep.http")
Q_LOGGING_CATEGORY(appStore, "todokeep.store")

namespace {

struct LogSink {
    QFile file;
    QTextStream stream;

    explicit LogSink(const QString &path) : file(path) {}
};

QMutex g_sinkMutex;
std::unique_ptr<LogSink> g_sink;

void writeMessage(QtMsgType type, const QMessageLogContext &ctx, const QString &msg) {
    const QString line = qFormatLogMessage(type, ctx, msg);

    fprintf(stderr, "%s\n", line.toLocal8Bit().constData());

    QMutexLocker lock(&g_sinkMutex);
    if (!g_sink) {
        return;
    }
    g_sink->stream << line << '\n';
    // Warnings and above are flushed right away.
    if (type != QtDebugMsg && type != QtInfoMsg) {
        g_sink->stream.flush();
    }
}

} // END NAMESPACE

QString loggingFilterRules(bool verbose) {
    QString rules = QStringLiteral("todokeep.*.info=true\n"
                                   "qt.network.ssl.warning=false\n");
    rules += verbose ? QStringLiteral("todokeep.*.debug=true\n")
                     : QStringLiteral("todokeep.*.debug=false\n");
    return rules;
}

bool initLogging(const QString &filePath, bool verbose) {
    qSetMessagePattern("%{time yyyy-MM-dd hh:mm:ss.zzz} [%{type}] %{category} "
                       "(%{if-debug}%{function}:%{line}%{endif}): %{message}");
    QLoggingCategory::setFilterRules(loggingFilterRules(verbose));

    bool fileOk = true;
    {
        QMutexLocker lock(&g_sinkMutex);
        g_sink.reset();
        if (!filePath.isEmpty()) {
            auto sink = std::make_unique<LogSink>(filePath);
            if (sink->file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
                sink->stream.setDevice(&sink->file);
                g_sink = std::move(sink);
            } else {
                fileOk = false;
            }
        }
    }

    qInstallMessageHandler(writeMessage);

    if (!fileOk) {
        qWarning(appCore) << "Failed to open log file:" << filePath;
    }
    qInfo(appCore) << "Logging initialized"
                   << (filePath.isEmpty() || !fileOk ? QStringLiteral("(stderr only)")
                                                     : QStringLiteral("-> %1").arg(filePath))
                   << (verbose ? "verbose" : "");
    return fileOk;
}

void shutdownLogging() {
    qInstallMessageHandler(nullptr);

    QMutexLocker lock(&g_sinkMutex);
    if (g_sink) {
        g_sink->stream.flush();
        g_sink->file.close();
        g_sink.reset();
    }
}
