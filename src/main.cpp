// clang-format off
/*
 * GhostDiff - Structural Text Comparison
 *
 * SPDX-FileCopyrightText: 2026 GhostDiff contributors
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
// clang-format on

#include "DiffPrinter.h"
#include "GhostDiffEngine.h"
#include "Logging.h"
#include "options.h"
#include "SectionFolding.h"
#include "SourceData.h"
#include "version.h"

#include <exception>

#include <KAboutData>
#include <KLocalizedString>
#include <KSharedConfig>

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QStringList>
#include <QTextStream>

namespace {
// Exit codes follow diff(1): 0 same, 1 different, 2 trouble.
constexpr qint32 exitNoDifferences = 0;
constexpr qint32 exitDifferences = 1;
constexpr qint32 exitTrouble = 2;

void initialiseCmdLineArgs(QCommandLineParser* cmdLineParser)
{
    cmdLineParser->addOption(QCommandLineOption({u8"c", u8"collapse"}, i18n("Start with all matching sections collapsed.")));
    cmdLineParser->addOption(QCommandLineOption({u8"s", u8"summary"}, i18n("Only print the number of differences and where they are.")));
    cmdLineParser->addOption(QCommandLineOption(u8"cs", i18n("Override a config setting. Use once for every setting. E.g.: --cs \"LookAheadWindow=8\""), u8"string"));
    cmdLineParser->addOption(QCommandLineOption(u8"confighelp", i18n("Show list of config settings and current values.")));
    cmdLineParser->addOption(QCommandLineOption(u8"config", i18n("Use a different config file."), u8"file"));
    cmdLineParser->addOption(QCommandLineOption(u8"saveconfig", i18n("Write all config settings, defaults included, to the config file and exit. --cs overrides are not saved.")));
    cmdLineParser->addOption(QCommandLineOption(u8"L1", i18n("Visible name replacement for the original file."), u8"alias1"));
    cmdLineParser->addOption(QCommandLineOption(u8"L2", i18n("Visible name replacement for the ghost file."), u8"alias2"));

    cmdLineParser->addPositionalArgument(u8"original", i18n("Baseline document."));
    cmdLineParser->addPositionalArgument(u8"ghost", i18n("Proposed version to compare against the baseline."));
}

bool readSource(SourceData& source, const QString& fileName, const QString& aliasName)
{
    source.setFilename(fileName);
    source.setAliasName(aliasName);
    source.readAndPreprocess();

    if(source.isValid())
        return true;

    QTextStream err(stderr);
    for(const QString& error: source.getErrors())
        err << error << "\n";

    return false;
}
} // namespace

qint32 main(qint32 argc, char* argv[])
{
    constexpr QLatin1String appName("ghostdiff", sizeof("ghostdiff") - 1);

    QCoreApplication app(argc, argv); // KAboutData and QCommandLineParser depend on this being setup.
    KLocalizedString::setApplicationDomain(appName.data());

    const QString i18nName = i18n("GhostDiff");
    const QString description = i18n("Structural comparison of JSON and YAML shaped text");
    const QString copyright = i18n("(c) 2026 GhostDiff contributors");
    const QString appVersion(GHOSTDIFF_VERSION_STRING);

    KAboutData aboutData(appName, i18nName,
                         appVersion, description, KAboutLicense::GPL_V2, copyright);

    KAboutData::setApplicationData(aboutData);

    QCommandLineParser cmdLineParser;
    cmdLineParser.setApplicationDescription(aboutData.shortDescription());
    aboutData.setupCommandLine(&cmdLineParser);
    initialiseCmdLineArgs(&cmdLineParser);

    cmdLineParser.process(app);
    aboutData.processCommandLine(&cmdLineParser);

    Options options;
    options.init();

    const KSharedConfigPtr config = cmdLineParser.isSet(u8"config") ? KSharedConfig::openConfig(cmdLineParser.value(u8"config"), KConfig::SimpleConfig) : KSharedConfig::openConfig();
    options.readOptions(config);

    const QString configErrors = options.parseOptions(cmdLineParser.values(u8"cs"));
    if(!configErrors.isEmpty())
    {
        QTextStream(stderr) << i18n("Config Option Error:") << "\n" << configErrors;
        return exitTrouble;
    }

    if(cmdLineParser.isSet(u8"confighelp"))
    {
        QTextStream(stdout) << i18n("Current Configuration:") << "\n" << options.calcOptionHelp();
        return exitNoDifferences;
    }

    if(cmdLineParser.isSet(u8"saveconfig"))
    {
        options.saveOptions(config);
        if(!config->sync())
        {
            QTextStream(stderr) << i18n("Failed to write config file %1", config->name()) << "\n";
            return exitTrouble;
        }
        return exitNoDifferences;
    }

    const QStringList args = cmdLineParser.positionalArguments();
    if(args.count() != 2)
    {
        QTextStream(stderr) << i18n("Expected exactly two files: original and ghost.") << "\n\n" << cmdLineParser.helpText();
        return exitTrouble;
    }

    SourceData original;
    SourceData ghost;
    if(!readSource(original, args[0], cmdLineParser.value(u8"L1")) || !readSource(ghost, args[1], cmdLineParser.value(u8"L2")))
        return exitTrouble;

    if(original.isIncompleteConversion() || ghost.isIncompleteConversion())
        QTextStream(stderr) << i18n("Warning: invalid UTF-8 was replaced while reading the input.") << "\n";

    DiffResult result;
    try
    {
        result = GhostDiffEngine::compare(original.getText(), ghost.getText(), options);
    }
    catch(const std::exception& e)
    {
        // Line indices beyond the supported range.
        qCCritical(ghostdiffMain) << "compare failed:" << e.what();
        QTextStream(stderr) << i18n("Comparison failed: %1", QString::fromLocal8Bit(e.what())) << "\n";
        return exitTrouble;
    }

    QTextStream out(stdout);
    DiffPrinter printer(out, options.showLineNumbers());

    if(cmdLineParser.isSet(u8"summary"))
    {
        printer.printSummary(result);
    }
    else
    {
        SectionFolding folding;
        if(options.expandSectionsByDefault() && !cmdLineParser.isSet(u8"collapse"))
            folding.expandAll(result);

        out << "--- " << original.getAliasName() << "\n";
        out << "+++ " << ghost.getAliasName() << "\n";
        printer.printResult(result, folding);
    }

    return result.differenceCount() == 0 ? exitNoDifferences : exitDifferences;
}
