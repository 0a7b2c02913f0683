/*  This file is part of UsbLink, a cycle accurate USB 2.0 device link layer.
	Copyright (C) 2021 Michael Offel, Andreas Ley

	UsbLink is free software; you can redistribute it and/or
	modify it under the terms of the GNU Lesser General Public
	License as published by the Free Software Foundation; either
	version 3 of the License, or (at your option) any later version.

	UsbLink is distributed in the hope that it will be useful,
	but WITHOUT ANY WARRANTY; without even the implied warranty of
	MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
	Lesser General Public License for more details.

	You should have received a copy of the GNU Lesser General Public
	License along with this library; if not, write to the Free Software
	Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301  USA
*/
#pragma once

#include <yaml-cpp/yaml.h>
#include <magic_enum.hpp>
#include <boost/lexical_cast.hpp>

#include <cctype>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <filesystem>
#include <vector>

namespace usblink::utils
{
	std::optional<std::string_view> globbingMatchPath(std::string_view pattern, std::string_view str);
	std::string replaceEnvVars(const std::string& src);

	/**
	 * @brief Read only view on one or more layered yaml documents.
	 * @details Paths are separated by '/' and map keys may contain '*' wildcards. When several
	 * documents are loaded, later documents override earlier ones for scalar values.
	 * Scalars of the form "$(NAME)" are substituted from the environment.
	 */
	class ConfigTree
	{
	public:
		struct iterator {
			const ConfigTree& src;
			YAML::Node::const_iterator it;

			void operator++() { ++it; }
			ConfigTree operator*() { return ConfigTree(*it); }
			bool operator==(const iterator& rhs) const { return it == rhs.it; }
			bool operator!=(const iterator& rhs) const { return it != rhs.it; }
		};

		struct map_iterator
		{
			const ConfigTree& src;
			YAML::Node::const_iterator it;

			void operator++() { ++it; }
			ConfigTree operator*() { return ConfigTree(it->second); }
			bool operator==(const map_iterator& rhs) const { return it == rhs.it; }
			bool operator!=(const map_iterator& rhs) const { return it != rhs.it; }

			std::string key() const { return it->first.as<std::string>(); }
		};

	public:
		ConfigTree() = default;
		ConfigTree(YAML::Node node);

		explicit operator bool() const { return isDefined(); }
		bool isDefined() const;
		bool isNull() const;
		bool isScalar() const;
		bool isSequence() const;
		bool isMap() const;

		map_iterator mapBegin() const;
		map_iterator mapEnd() const;

		iterator begin() const;
		iterator end() const;
		size_t size() const;
		ConfigTree operator[](size_t index) const;

		ConfigTree operator[](std::string_view path) const;
		template<typename T> T as(const T& def) const;
		template<typename T> T as() const;

		void loadFromFile(const std::filesystem::path &filename);
		void loadFromString(const std::string &document);

	protected:
		std::vector<YAML::Node> m_nodes;
	};

	template<typename T>
	inline T ConfigTree::as(const T& def) const
	{
		if (m_nodes.size() != 1)
			return def;

		T ret;
		try {
			ret = m_nodes.front().as<T>();
		} catch (const YAML::Exception &) {
			auto str = m_nodes.front().as<std::string>();
			if (str.empty() || str[0] != '$')
				throw;
			str = replaceEnvVars(str);
			if constexpr (std::is_same_v<T, bool>) {
				if (str == "false" || str == "No")
					ret = false;
				else if (str == "true" || str == "Yes")
					ret = true;
				else
					throw;
			} else
				if constexpr (std::is_integral_v<T> || std::is_floating_point_v<T>)
					ret = boost::lexical_cast<T>(str);
				else throw;
		}
		return ret;
	}

	template<typename T>
	inline T ConfigTree::as() const
	{
		if (m_nodes.size() != 1)
			throw std::runtime_error{ "non optional config value not found" };

		return m_nodes.front().as<T>();
	}

	template<>
	inline std::string ConfigTree::as(const std::string& def) const
	{
		std::string ret;
		if (m_nodes.size() != 1)
			ret = def;
		else
			ret = m_nodes.front().as<std::string>();

		return replaceEnvVars(ret);
	}

	template<>
	inline std::string ConfigTree::as() const
	{
		if (m_nodes.size() != 1)
			throw std::runtime_error{ "non optional config value not found" };

		return replaceEnvVars(m_nodes.front().as<std::string>());
	}
}

namespace YAML
{
	template<typename T>
	struct convert
	{
		static auto encode(T value) -> std::enable_if_t<std::is_enum_v<T>, Node>
		{
			return Node{ std::string{ magic_enum::enum_name(value) } };
		}

		static auto decode(const Node& node, T& out) -> std::enable_if_t<std::is_enum_v<T>, bool>
		{
			const std::string value = node.as<std::string>();
			const std::optional<T> eval = magic_enum::enum_cast<T>(value,
				[](char a, char b) { return std::tolower(a) == std::tolower(b); });

			if (eval)
			{
				out = *eval;
				return true;
			}

			std::ostringstream err;
			err << "unknown value '" << value << "' for enum " << magic_enum::enum_type_name<T>()
				<< ". Valid values are ";

			auto names = magic_enum::enum_names<T>();
			for (size_t i = 0; i < names.size(); ++i)
			{
				if (i == names.size() - 1 && names.size() > 1)
					err << " or ";
				else if (i != 0)
					err << ", ";
				err << names[i];
			}

			throw std::runtime_error{ err.str() };
		}
	};
}
