#include "report/report_assembler.hpp"

#include <iostream>
#include <utility>

#include <QDir>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "sections/section_collector.hpp"

namespace inventory {

const char kScriptLabel[] = "collect_inventory";

QString reportFileName(const QDateTime &timestamp)
{
    return QStringLiteral("%1_%2.txt")
        .arg(QString::fromLatin1(kScriptLabel),
             timestamp.toLocalTime().toString(QStringLiteral("yyyyMMdd_HHmmss")));
}

std::string isoWithOffset(const QDateTime &timestamp)
{
    // Qt::ISODate collapses a zero offset to "Z"; always spell it out.
    const int offsetMinutes = timestamp.offsetFromUtc() / 60;
    const int absMinutes = offsetMinutes < 0 ? -offsetMinutes : offsetMinutes;
    const QString offset = QStringLiteral("%1%2:%3")
                               .arg(offsetMinutes < 0 ? QLatin1Char('-') : QLatin1Char('+'))
                               .arg(absMinutes / 60, 2, 10, QLatin1Char('0'))
                               .arg(absMinutes % 60, 2, 10, QLatin1Char('0'));
    return (timestamp.toString(QStringLiteral("yyyy-MM-dd'T'HH:mm:ss")) + offset).toStdString();
}

std::string reportTimestamp(const QDateTime &timestamp)
{
    return isoWithOffset(timestamp.toLocalTime());
}

std::string renderHeader(const Report &report)
{
    return "# Inventory Snapshot - " + report.timestamp + "\n"
        + "# Script: " + report.label + "\n"
        + "\n";
}

std::string renderSection(const RenderedSection &section)
{
    return "\n== " + section.title + " ==\n" + section.body;
}

std::string renderFooter()
{
    return "\n# End of report\n";
}

std::string renderReport(const Report &report)
{
    std::string out = renderHeader(report);
    for (const auto &section : report.sections) {
        out += renderSection(section);
    }
    out += renderFooter();
    return out;
}

ReportSink::ReportSink(QFile *file, std::ostream &terminal)
    : m_file(file)
    , m_terminal(terminal)
    , m_fileOk(file != nullptr)
{
}

void ReportSink::write(const std::string &chunk)
{
    m_terminal << chunk << std::flush;

    if (!m_fileOk) {
        return;
    }
    const QByteArray data = QByteArray::fromStdString(chunk);
    if (m_file->write(data) != data.size() || !m_file->flush()) {
        m_fileOk = false;
        std::cerr << "Failed to write report file " << m_file->fileName().toStdString()
                  << ": " << m_file->errorString().toStdString() << std::endl;
        ILOG_ERROR(QStringLiteral("ReportAssembler"),
                   QStringLiteral("ReportSink::write"),
                   QStringLiteral("report_write_failed"),
                   QStringLiteral("io_error"),
                   QStringLiteral("qfile_write"),
                   inventory::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"path", m_file->fileName().toStdString()},
                                   {"error", m_file->errorString().toStdString()}}));
    }
}

ReportAssembler::ReportAssembler(const PlatformProfile &profile,
                                 const RunConfig &config,
                                 const DataSource &source)
    : m_profile(profile)
    , m_config(config)
    , m_source(source)
{
}

Report ReportAssembler::assemble(const std::vector<SectionKind> &sections,
                                 const QDateTime &timestamp,
                                 ReportSink *sink) const
{
    Report report;
    report.timestamp = reportTimestamp(timestamp);
    report.label = kScriptLabel;

    if (sink) {
        sink->write(renderHeader(report));
    }

    const SectionContext context{m_profile, m_config, m_source};
    for (const SectionKind kind : sections) {
        const auto collector = makeCollector(kind);
        if (!collector) {
            continue;
        }
        RenderedSection section{kind, collector->title(), collector->collect(context)};
        ILOG_DEBUG(QStringLiteral("ReportAssembler"),
                   QStringLiteral("assemble"),
                   QStringLiteral("section_collected"),
                   QStringLiteral("report_run"),
                   QStringLiteral("section_collector"),
                   inventory::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"section", kind},
                                   {"bytes", section.body.size()}}));
        if (sink) {
            sink->write(renderSection(section));
        }
        report.sections.push_back(std::move(section));
    }

    if (sink) {
        sink->write(renderFooter());
    }
    return report;
}

bool ReportAssembler::persist(const std::vector<SectionKind> &sections,
                              const QString &directory,
                              const QDateTime &timestamp,
                              std::ostream &terminal,
                              QString *path) const
{
    const QString fileName = reportFileName(timestamp);
    const QString filePath =
        directory.isEmpty() ? fileName : QDir(directory).filePath(fileName);
    if (path) {
        *path = filePath;
    }

    QFile file(filePath);
    const bool opened = file.open(QIODevice::WriteOnly | QIODevice::Truncate);
    if (!opened) {
        std::cerr << "Failed to create report file " << filePath.toStdString()
                  << ": " << file.errorString().toStdString()
                  << "; continuing on the terminal only." << std::endl;
        ILOG_ERROR(QStringLiteral("ReportAssembler"),
                   QStringLiteral("persist"),
                   QStringLiteral("report_open_failed"),
                   QStringLiteral("io_error"),
                   QStringLiteral("qfile_open"),
                   inventory::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"path", filePath.toStdString()},
                                   {"error", file.errorString().toStdString()}}));
    }

    ReportSink sink(opened ? &file : nullptr, terminal);
    const Report report = assemble(sections, timestamp, &sink);
    if (opened) {
        file.close();
    }

    ILOG_INFO(QStringLiteral("ReportAssembler"),
              QStringLiteral("persist"),
              QStringLiteral("report_written"),
              QStringLiteral("report_run"),
              QStringLiteral("tee_file_and_terminal"),
              inventory::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"path", filePath.toStdString()},
                              {"sections", report.sections.size()},
                              {"fileOk", sink.fileOk()}}));
    return sink.fileOk();
}

} // namespace inventory
