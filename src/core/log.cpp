#include "pch.h"
#include "nocgen/log.h"

using namespace nocgen;
using namespace nocgen::log;

namespace
{
    void default_handler(const Message& msg)
    {
        const char* lvl_str = "";

        switch (msg.level)
        {
        case Message::DEBUG: lvl_str = "Debug"; break;
        case Message::ERROR: lvl_str = "Error"; break;
        case Message::FATAL: lvl_str = "Fatal"; break;
        case Message::INFO: lvl_str = "Info"; break;
        case Message::WARN: lvl_str = "Warning"; break;
        }

        printf("%s: %s\n", lvl_str, msg.msg.c_str());
        fflush(stdout);
    }

    Handler s_handler = default_handler;

    // The explorer logs from worker threads
    std::atomic<Message::Level> s_level(Message::INFO);
    std::mutex s_mutex;

    void msg_internal(Message::Level lvl, const char* fmt, va_list vl)
    {
        if (lvl < s_level)
            return;

        // Size the text first so long messages aren't cut short
        va_list vl2;
        va_copy(vl2, vl);
        int len = vsnprintf(nullptr, 0, fmt, vl2);
        va_end(vl2);

        std::vector<char> buf(len > 0 ? len + 1 : 1, '\0');
        if (len > 0)
            vsnprintf(buf.data(), buf.size(), fmt, vl);

        Message msg;
        msg.level = lvl;
        msg.msg = std::string(buf.data());

        // The handler runs unlocked, so it may log or replace itself
        Handler handler;
        {
            std::lock_guard<std::mutex> lock(s_mutex);
            handler = s_handler;
        }

        handler(msg);
    }
}

void log::set_handler(const Handler& h)
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_handler = h ? h : Handler(default_handler);
}

void log::reset_handler()
{
    set_handler(default_handler);
}

void log::set_level(Message::Level lvl)
{
    s_level = lvl;
}

Message::Level log::get_level()
{
    return s_level;
}

void log::msg(Message::Level lvl, const char* fmt, ...)
{
    va_list vl;
    va_start(vl, fmt);
    msg_internal(lvl, fmt, vl);
    va_end(vl);
}

#define templ(name,e) \
void log::name(const char* fmt, ...) \
{ \
    va_list vl; \
    va_start(vl, fmt); \
    msg_internal(Message::e, fmt, vl); \
    va_end(vl); \
}

templ(fatal,FATAL)
templ(error,ERROR)
templ(warn,WARN)
templ(info,INFO)
templ(debug,DEBUG)
