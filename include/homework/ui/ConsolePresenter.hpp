#pragma once

#include <QTextStream>

#include "homework/core/Presenter.hpp"

namespace homework {
namespace ui {

// Plain-text presenter for the command-line front-end.
class ConsolePresenter : public core::Presenter
{
public:
    explicit ConsolePresenter(QTextStream &out, QTextStream &err);

    void notifyUser(const QString &message, core::Severity severity) override;
    void presentList(const std::vector<core::HomeworkRow> &rows,
                     std::optional<double> progress) override;
    void presentAggregates(const core::Aggregates &aggregates) override;

    void setShowPartialResults(bool show);
    void setShowAggregates(bool show);
    void setShowList(bool show);

    static QString statusLabel(core::StatusTag tag);

private:
    QTextStream &m_out;
    QTextStream &m_err;
    bool m_showPartialResults = false;
    bool m_showAggregates = true;
    bool m_showList = true;
};

} // namespace ui
} // namespace homework
