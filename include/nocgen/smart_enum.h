#pragma once

#include <cctype>
#include <string>
#include <vector>

//
// Defines a wrapper around an enum that has string conversion capability.
// SMART_ENUM(MyEnum, A, B, C...) behaves like:
//
// enum class MyEnum
// {
//    A, B, C, ...
// };
//
// plus a to_string() method and a static from_string() method. Names are
// reported in lowercase. Parsing ignores case and underscores, so
// "ClockConverter", "clock_converter" and "CLOCK_CONVERTER" are the same name.
//

namespace nocgen
{
	class SmartEnumTable
	{
	public:
		SmartEnumTable(const char* str)
		{
			std::string cur;
			for (const char* p = str; ; ++p)
			{
				if (*p == '\0' || *p == ',' || std::isspace((unsigned char)*p))
				{
					if (!cur.empty())
						m_names.push_back(cur);
					cur.clear();

					if (*p == '\0')
						break;
				}
				else
				{
					cur += (char)std::tolower((unsigned char)*p);
				}
			}
		}

		unsigned size() const
		{
			return (unsigned)m_names.size();
		}

		const char* to_string(unsigned val) const
		{
			return val >= m_names.size() ? nullptr : m_names[val].c_str();
		}

		bool from_string(const std::string& str, unsigned& out) const
		{
			std::string key = squash(str);

			for (unsigned i = 0; i < m_names.size(); i++)
			{
				if (squash(m_names[i]) == key)
				{
					out = i;
					return true;
				}
			}
			return false;
		}

	protected:
		static std::string squash(const std::string& str)
		{
			std::string result;
			for (char c : str)
			{
				if (c != '_')
					result += (char)std::tolower((unsigned char)c);
			}
			return result;
		}

		std::vector<std::string> m_names;
	};
}

#define SMART_ENUM(name, ...) \
	class name \
	{ \
	public: \
		enum name##_e { __VA_ARGS__ }; \
		\
		name() = default; \
		name(const name&) = default; \
		name& operator=(const name&) = default; \
		bool operator < (const name& e) const { return m_val < e.m_val; } \
		\
		name(name##_e val) : m_val(val) {} \
		operator name##_e() const { return m_val; } \
		const char* to_string() const \
		{ \
			return get_table().to_string((unsigned)m_val); \
		} \
		\
		static bool from_string(const std::string& str, name& out) \
		{ \
			unsigned tmp; \
			if (!get_table().from_string(str, tmp)) \
				return false; \
			out.m_val = (name##_e)tmp; \
			return true; \
		} \
		\
		static unsigned size() \
		{ \
			return get_table().size(); \
		} \
		\
		static const nocgen::SmartEnumTable& get_table() \
		{ \
			static const nocgen::SmartEnumTable tab(#__VA_ARGS__); \
			return tab; \
		} \
	protected: \
		name##_e m_val = (name##_e)0; \
	};
