#include "homework/ui/ConsolePresenter.hpp"

#include <QObject>

#include "homework/data/DateFormat.hpp"

namespace homework {
namespace ui {

namespace {
constexpr int CODE_WIDTH = 10;
constexpr int SUBJECT_WIDTH = 14;
constexpr int CONTENT_WIDTH = 32;
constexpr int DATE_WIDTH = 12;

QString fit(const QString &text, int width)
{
    if (text.size() <= width) {
        return text.leftJustified(width);
    }
    return text.left(width - 1) + QChar(0x2026);
}
} // namespace

ConsolePresenter::ConsolePresenter(QTextStream &out, QTextStream &err)
    : m_out(out)
    , m_err(err)
{
}

void ConsolePresenter::notifyUser(const QString &message, core::Severity severity)
{
    switch (severity) {
    case core::Severity::Error:
        m_err << QObject::tr("error: %1").arg(message) << '\n';
        m_err.flush();
        break;
    case core::Severity::Warning:
        m_err << QObject::tr("warning: %1").arg(message) << '\n';
        m_err.flush();
        break;
    case core::Severity::Info:
        m_out << message << '\n';
        m_out.flush();
        break;
    }
}

void ConsolePresenter::presentList(const std::vector<core::HomeworkRow> &rows,
                                   std::optional<double> progress)
{
    if (progress) {
        if (m_showPartialResults) {
            m_out << QObject::tr("Loading... %1%").arg(qRound(*progress * 100)) << '\n';
            m_out.flush();
        }
        return;
    }
    if (!m_showList) {
        return;
    }

    m_out << fit(QObject::tr("Code"), CODE_WIDTH) << ' ' << fit(QObject::tr("Subject"), SUBJECT_WIDTH)
          << ' ' << fit(QObject::tr("Content"), CONTENT_WIDTH) << ' '
          << fit(QObject::tr("Created"), DATE_WIDTH) << ' ' << fit(QObject::tr("Due"), DATE_WIDTH)
          << ' ' << QObject::tr("Status") << '\n';
    for (const auto &row : rows) {
        m_out << fit(row.item.code, CODE_WIDTH) << ' ' << fit(row.item.subject, SUBJECT_WIDTH) << ' '
              << fit(row.item.content, CONTENT_WIDTH) << ' ' << fit(row.item.createDate, DATE_WIDTH)
              << ' ' << fit(row.item.dueDate, DATE_WIDTH) << ' ' << statusLabel(row.tag) << '\n';
    }
    m_out << QObject::tr("%1 homework listed").arg(rows.size()) << '\n';
    m_out.flush();
}

void ConsolePresenter::presentAggregates(const core::Aggregates &aggregates)
{
    if (!m_showAggregates) {
        return;
    }
    const auto &counts = aggregates.statusCounts;
    m_out << QObject::tr("Total: %1 | Completed: %2 | Overdue: %3 | Due today: %4 | Due soon: %5")
                 .arg(aggregates.total)
                 .arg(counts.completed)
                 .arg(counts.overdue)
                 .arg(counts.dueToday)
                 .arg(counts.dueSoon)
          << '\n';
    for (const auto &day : aggregates.daily) {
        m_out << "  " << data::formatDate(day.date) << "  "
              << QObject::tr("created %1, due %2").arg(day.created).arg(day.due) << '\n';
    }
    m_out.flush();
}

void ConsolePresenter::setShowPartialResults(bool show)
{
    m_showPartialResults = show;
}

void ConsolePresenter::setShowAggregates(bool show)
{
    m_showAggregates = show;
}

void ConsolePresenter::setShowList(bool show)
{
    m_showList = show;
}

QString ConsolePresenter::statusLabel(core::StatusTag tag)
{
    switch (tag) {
    case core::StatusTag::Completed:
        return QObject::tr("completed");
    case core::StatusTag::DueToday:
        return QObject::tr("due today");
    case core::StatusTag::Overdue:
        return QObject::tr("overdue");
    case core::StatusTag::DueSoon:
        return QObject::tr("due soon");
    case core::StatusTag::Pending:
    default:
        return QObject::tr("in progress");
    }
}

} // namespace ui
} // namespace homework
