#include "to_debug_string.hh"

std::string uc::impl::to_debug_string_char(char c)
{
    auto s = std::string("'");

    switch (c)
    {
    case '\0':
        s += "\\0";
        break;
    case '\n':
        s += "\\n";
        break;
    case '\r':
        s += "\\r";
        break;
    case '\t':
        s += "\\t";
        break;
    case '\\':
        s += "\\\\";
        break;
    case '\'':
        s += "\\'";
        break;
    default:
        if (c >= 0 && (c < 32 || c == 127))
            s += std::format("\\x{:02X}", static_cast<unsigned char>(c));
        else
            s += c;
    }

    s += '\'';
    return s;
}

std::string uc::impl::to_debug_string_memory(void const* p, std::size_t size, std::size_t align)
{
    auto s = std::string("0x");
    auto const bytes = static_cast<unsigned char const*>(p);
    for (std::size_t i = 0; i < size; ++i)
    {
        if (i > 0 && i % align == 0)
            s += "_";
        s += std::format("{:02X}", bytes[i]);
    }
    return s;
}
