#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include <QDateTime>
#include <QFile>
#include <QString>

#include "common/models.hpp"
#include "core/host_system.hpp"

namespace inventory {

extern const char kScriptLabel[];

// <label>_<yyyyMMdd>_<HHmmss>.txt, local time, second granularity.
QString reportFileName(const QDateTime &timestamp);

// ISO-8601 in the timestamp's own offset, always as +hh:mm/-hh:mm (never "Z").
std::string isoWithOffset(const QDateTime &timestamp);

// isoWithOffset() of the local time, e.g. 2026-10-19T14:03:07+02:00.
std::string reportTimestamp(const QDateTime &timestamp);

std::string renderHeader(const Report &report);
std::string renderSection(const RenderedSection &section);
std::string renderFooter();
std::string renderReport(const Report &report);

/**
 * Writes every chunk to the report file and the terminal stream, flushing
 * both so an interrupted run leaves at worst a truncated file.
 * A failing or missing file (nullptr) never stops the terminal copy.
 */
class ReportSink
{
public:
    ReportSink(QFile *file, std::ostream &terminal);

    void write(const std::string &chunk);
    bool fileOk() const { return m_fileOk; }

private:
    QFile *m_file;
    std::ostream &m_terminal;
    bool m_fileOk;
};

class ReportAssembler
{
public:
    ReportAssembler(const PlatformProfile &profile,
                    const RunConfig &config,
                    const DataSource &source);

    // Runs the collectors for `sections` in order. With a sink, the header,
    // each section and the footer are streamed as soon as they are ready.
    Report assemble(const std::vector<SectionKind> &sections,
                    const QDateTime &timestamp,
                    ReportSink *sink = nullptr) const;

    /**
     * Creates the report file in `directory` (the working directory when
     * empty), then assembles into it while echoing to `terminal`.
     * The report always reaches `terminal`. Returns false if the file could
     * not be created or written; `path` is filled in either way.
     */
    bool persist(const std::vector<SectionKind> &sections,
                 const QString &directory,
                 const QDateTime &timestamp,
                 std::ostream &terminal,
                 QString *path) const;

private:
    const PlatformProfile &m_profile;
    const RunConfig &m_config;
    const DataSource &m_source;
};

} // namespace inventory
