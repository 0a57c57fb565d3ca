// tagsmith: runs one structure-tree session over a JSON document dump.
//
// document.json + sidecar  → Engine → structure tree + MCID map (stdout or --out)
//                                   → remediation report (--report)
//
// Exit codes: 0 success, 1 session failed or cancelled, 2 usage/input error.

#include "document.h"
#include "engine.h"
#include "options.h"
#include "report.h"
#include "sidecar.h"
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFileInfo>
#include <QJsonDocument>
#include <QLoggingCategory>
#include <cstdio>

static void printErr(const QString& s) {
    fprintf(stderr, "%s\n", s.toUtf8().constData());
}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("tagsmith"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Builds an accessibility structure tree from extracted page content and a sidecar of edits."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("document"), QStringLiteral("Document dump (JSON)."));

    QCommandLineOption sidecarOpt(QStringLiteral("sidecar"),
        QStringLiteral("Sidecar file (default: <document>_sidecar.json)."), QStringLiteral("file"));
    QCommandLineOption configOpt(QStringLiteral("config"),
        QStringLiteral("Engine options (INI, group [engine])."), QStringLiteral("file"));
    QCommandLineOption outOpt(QStringLiteral("out"),
        QStringLiteral("Write the structure tree and MCID map here instead of stdout."), QStringLiteral("file"));
    QCommandLineOption reportOpt(QStringLiteral("report"),
        QStringLiteral("Write a JSON remediation report."), QStringLiteral("file"));
    QCommandLineOption quietOpt(QStringLiteral("quiet"),
        QStringLiteral("No progress, status or debug output."));
    parser.addOptions({sidecarOpt, configOpt, outOpt, reportOpt, quietOpt});

    if (!parser.parse(app.arguments())) {
        printErr(parser.errorText());
        return 2;
    }
    if (parser.isSet(QStringLiteral("help"))) {
        printf("%s", parser.helpText().toUtf8().constData());
        return 0;
    }
    if (parser.isSet(QStringLiteral("version"))) {
        parser.showVersion();
    }

    const QStringList args = parser.positionalArguments();
    if (args.size() != 1) {
        printErr(parser.helpText());
        return 2;
    }
    const bool quiet = parser.isSet(quietOpt);
    if (quiet)
        QLoggingCategory::setFilterRules(QStringLiteral("*.debug=false\n*.info=false"));

    // ── Inputs ──

    const QString docPath = args.first();
    QString err;
    auto doc = tsm::MemoryDocument::fromFile(docPath, &err);
    if (!doc) {
        printErr(QStringLiteral("tagsmith: %1").arg(err));
        return 2;
    }

    tsm::Sidecar sidecar = tsm::Sidecar::forPageCount(doc->pageCount());
    const QString sidecarPath = parser.isSet(sidecarOpt)
        ? parser.value(sidecarOpt) : tsm::Sidecar::defaultPathFor(docPath);
    tsm::Diagnostics loadDiags;
    if (QFileInfo::exists(sidecarPath)) {
        if (!sidecar.load(sidecarPath, &err, &loadDiags)) {
            printErr(QStringLiteral("tagsmith: %1").arg(err));
            return 2;
        }
    } else if (parser.isSet(sidecarOpt)) {
        printErr(QStringLiteral("tagsmith: sidecar %1 does not exist").arg(sidecarPath));
        return 2;
    }

    tsm::EngineOptions options;
    if (parser.isSet(configOpt)) {
        if (!QFileInfo::exists(parser.value(configOpt))) {
            printErr(QStringLiteral("tagsmith: config %1 does not exist").arg(parser.value(configOpt)));
            return 2;
        }
        options = tsm::EngineOptions::fromIniFile(parser.value(configOpt));
    }

    // ── Session ──

    tsm::Engine engine(options);
    tsm::SessionResult res = engine.run(*doc, sidecar, [quiet](const tsm::Progress& p) {
        if (!quiet)
            printErr(QStringLiteral("[%1%] %2").arg(p.percent, 3).arg(p.message));
        return true;
    });
    res.diagnostics = loadDiags + res.diagnostics;

    if (!quiet) {
        printErr(res.statusReport);
        printErr(res.elementSummary);
        for (const auto& d : res.diagnostics) {
            if (d.severity == tsm::Severity::Info) continue;
            const QString where = d.page >= 0 ? QStringLiteral(" (page %1)").arg(d.page) : QString();
            printErr(QStringLiteral("%1%2: %3")
                         .arg(QString::fromLatin1(tsm::severityToString(d.severity)), where, d.message));
        }
    }

    // ── Outputs ──

    QJsonObject out;
    out["StructTreeRoot"] = res.structTree;
    out["mcid_map"]       = tsm::mcidMapToJson(res.mcidMap);

    if (parser.isSet(outOpt)) {
        if (!tsm::writeJsonFile(parser.value(outOpt), out, &err)) {
            printErr(QStringLiteral("tagsmith: %1").arg(err));
            return 2;
        }
    } else {
        QByteArray bytes = QJsonDocument(out).toJson(QJsonDocument::Indented);
        fwrite(bytes.constData(), 1, bytes.size(), stdout);
        fflush(stdout);
    }

    if (parser.isSet(reportOpt)) {
        tsm::ReportInput input;
        input.sourceFile = docPath;
        input.exportFile = parser.value(outOpt);
        if (!tsm::writeJsonFile(parser.value(reportOpt), tsm::buildReport(res, input), &err)) {
            printErr(QStringLiteral("tagsmith: %1").arg(err));
            return 2;
        }
    }

    if (!res.ok) {
        printErr(QStringLiteral("tagsmith: session failed: %1").arg(res.error));
        return 1;
    }
    return 0;
}
