#pragma once
#include <wx/log.h>
#include <wx/string.h>

#include <string>
#include <vector>

// Log target that records formatted messages instead of printing them
class CapturedLog : public wxLog
{
public:
    bool Contains(const std::string &text) const
    {
        for (const auto &message : m_messages)
        {
            if (message.Find(wxString::FromUTF8(text.c_str())) != wxNOT_FOUND)
            {
                return true;
            }
        }
        return false;
    }

    size_t Count() const { return m_messages.size(); }

protected:
    void DoLogTextAtLevel(wxLogLevel, const wxString &msg) override
    {
        m_messages.push_back(msg);
    }

private:
    std::vector<wxString> m_messages;
};

// Routes log output to a fresh CapturedLog for the lifetime of the object
class ScopedLogCapture
{
public:
    ScopedLogCapture() : m_previous(wxLog::SetActiveTarget(&m_log)) {}
    ~ScopedLogCapture() { wxLog::SetActiveTarget(m_previous); }

    ScopedLogCapture(const ScopedLogCapture &) = delete;
    ScopedLogCapture &operator=(const ScopedLogCapture &) = delete;

    const CapturedLog &log() const { return m_log; }

private:
    CapturedLog m_log;
    wxLog *m_previous;
};
