#pragma once

#include <string>
#include <vector>
#include <cstdarg>
#include <cstdio>
#include <algorithm>

namespace nocgen
{
namespace impl
{
	namespace util
	{
		// Check for existence of items in containers
		template <class T, class V>
		static bool exists(const T& container, const V& elem)
		{
			return std::find(container.begin(), container.end(), elem) != container.end();
		}

		// Extract just the keys
		template <class DEST, class SRC>
		static DEST keys(const SRC& src)
		{
			DEST result;
			for (const auto& i : src)
			{
				result.push_back(i.first);
			}
			return result;
		}

		// printf-style formatting into a std::string of any length
		static std::string fmt(const char* format, ...)
		{
			va_list vl;
			va_start(vl, format);

			va_list vl2;
			va_copy(vl2, vl);
			int len = vsnprintf(nullptr, 0, format, vl2);
			va_end(vl2);

			std::string result;
			if (len > 0)
			{
				std::vector<char> buf(len + 1);
				vsnprintf(buf.data(), buf.size(), format, vl);
				result.assign(buf.data(), len);
			}

			va_end(vl);
			return result;
		}
	}
}
}
