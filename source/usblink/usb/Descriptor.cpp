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
#include "usblink/pch.h"
#include "Descriptor.h"

#include <algorithm>
#include <bit>
#include <bitset>

namespace usblink::usb
{
	namespace
	{
		// descriptors that never belong to a configuration
		bool endsConfiguration(uint8_t type)
		{
			return type == DescriptorTypeId::string
				|| type == DescriptorTypeId::device
				|| type == DescriptorTypeId::deviceQualifier;
		}
	}

	void Descriptor::add(StringId index, std::wstring_view string, LangID language)
	{
		DescriptorEntry e;
		e.index = index.id;
		e.language = language;
		e.data.resize(string.size() * 2 + 2);

		USBLINK_DESIGNCHECK_HINT(e.data.size() < 256, "string descriptors are limited to 126 characters");
		e.data[0] = (uint8_t)e.data.size();
		e.data[1] = DescriptorTypeId::string;
		for (size_t i = 0; i < string.size(); ++i)
		{
			e.data[2 + i * 2 + 0] = string[i] & 0xFF;
			e.data[2 + i * 2 + 1] = (string[i] >> 8) & 0xFF;
		}

		const uint16_t langCode = uint16_t(language);
		auto it = std::find_if(m_entries.begin(), m_entries.end(), [](const DescriptorEntry &e) {
			return e.type() == DescriptorTypeId::string && e.index == 0;
		});
		if (it == m_entries.end())
		{
			DescriptorEntry langTable{
				.index = 0,
				.data = { 4, DescriptorTypeId::string, (uint8_t)langCode, (uint8_t)(langCode >> 8) }
			};
			m_entries.push_back(langTable);
		}
		else
		{
			bool known = false;
			for (size_t i = 2; i + 1 < it->data.size(); i += 2)
				known |= (it->data[i] | it->data[i + 1] << 8) == langCode;

			if (!known)
			{
				it->data.push_back((uint8_t)langCode);
				it->data.push_back((uint8_t)(langCode >> 8));
				USBLINK_DESIGNCHECK(it->data.size() < 256);
				it->data[0] = (uint8_t)it->data.size();
			}
		}
		m_entries.push_back(e);
	}

	void Descriptor::add(std::vector<uint8_t>&& data, uint8_t index)
	{
		USBLINK_DESIGNCHECK_HINT(data.size() >= 2 && data[0] == data.size(), "descriptors start with their length and type");

		// strings always go last
		auto it = std::find_if(m_entries.begin(), m_entries.end(), [](const DescriptorEntry &e) {
			return e.type() == DescriptorTypeId::string && e.index == 0;
		});

		m_entries.insert(it, DescriptorEntry{
			.index = index,
			.data = std::move(data)
		});
	}

	StringId Descriptor::allocateStringIndex(std::wstring_view string, LangID language)
	{
		StringId id = allocateStringIndex();
		add(id, string, language);
		return id;
	}

	void Descriptor::finalize()
	{
		DeviceDescriptor *device = nullptr;
		DeviceQualifierDescriptor *qualifier = nullptr;
		ConfigurationDescriptor *config = nullptr;
		InterfaceDescriptor *iface = nullptr;
		InterfaceAssociationDescriptor *iad = nullptr;
		std::bitset<256> endpointAddresses;

		uint8_t configIndex = 0;
		uint8_t interfaceIndex = 0;

		for (DescriptorEntry &e : m_entries)
		{
			switch (e.type())
			{
				case DeviceDescriptor::TYPE:
					device = &e.decode<DeviceDescriptor>();
					device->NumConfigurations = 0;
					config = nullptr;
					break;

				case DeviceQualifierDescriptor::TYPE:
					qualifier = &e.decode<DeviceQualifierDescriptor>();
					config = nullptr;
					break;

				case ConfigurationDescriptor::TYPE:
					if (device)
						device->NumConfigurations++;

					if (e.index == 0)
						e.index = configIndex++;
					else
						configIndex = e.index + 1;

					config = &e.decode<ConfigurationDescriptor>();
					config->TotalLength = 0;
					config->NumInterfaces = 0;
					if (config->ConfigurationValue == 0)
						config->ConfigurationValue = e.index + 1;

					iface = nullptr;
					iad = nullptr;
					interfaceIndex = 0;
					endpointAddresses.reset();
					break;

				case InterfaceAssociationDescriptor::TYPE:
					iad = &e.decode<InterfaceAssociationDescriptor>();
					iad->InterfaceCount = 0;
					break;

				case InterfaceDescriptor::TYPE:
					iface = &e.decode<InterfaceDescriptor>();
					iface->NumEndpoints = 0;
					if (iface->AlternateSetting == 0)
					{
						if (iface->InterfaceNumber == 0)
							iface->InterfaceNumber = interfaceIndex++;
						else
							interfaceIndex = iface->InterfaceNumber + 1;

						if (config)
							config->NumInterfaces++;

						if (iad)
						{
							if (iad->InterfaceCount == 0)
							{
								iad->FirstInterface = iface->InterfaceNumber;
								if (iad->FunctionClass == 0)
									iad->FunctionClass = iface->Class;
								if (iad->FunctionSubClass == 0)
									iad->FunctionSubClass = iface->SubClass;
							}
							iad->InterfaceCount++;
						}
					}
					break;

				case EndpointDescriptor::TYPE:
					USBLINK_DESIGNCHECK_HINT(iface, "endpoint descriptors must follow an interface descriptor");
					if (iface->AlternateSetting == 0)
					{
						// alternate settings may reuse the endpoints of setting 0
						uint8_t addr = e.decode<EndpointDescriptor>().Address;
						USBLINK_DESIGNCHECK_HINT(!endpointAddresses[addr], "endpoint address used twice in one configuration");
						endpointAddresses[addr] = true;
					}
					iface->NumEndpoints++;
					break;

				case DescriptorTypeId::string:
					config = nullptr;
					break;

				default:
					break;
			}

			if (config)
				config->TotalLength += (uint16_t)e.data.size();
		}

		if (device && qualifier)
		{
			qualifier->USB = device->USB;
			qualifier->Class = device->Class;
			qualifier->SubClass = device->SubClass;
			qualifier->Protocol = device->Protocol;
			qualifier->MaxPacketSize = device->MaxPacketSize;
			qualifier->NumConfigurations = device->NumConfigurations;
		}
	}

	void Descriptor::changeMaxPacketSize(size_t value)
	{
		USBLINK_DESIGNCHECK_HINT(std::has_single_bit(value), "MaxPacketSize should be a power of two");
		USBLINK_DESIGNCHECK_HINT(value <= 512 && value >= 8, "MaxPacketSize should be between 8 and 512 byte");

		for (DescriptorEntry& e : m_entries)
		{
			if (e.type() == DeviceDescriptor::TYPE)
				e.decode<DeviceDescriptor>().MaxPacketSize = (uint8_t)std::min<size_t>(value, 64);
			else if (e.type() == DeviceQualifierDescriptor::TYPE)
				e.decode<DeviceQualifierDescriptor>().MaxPacketSize = (uint8_t)std::min<size_t>(value, 64);
			else if (e.type() == EndpointDescriptor::TYPE)
			{
				auto &ep = e.decode<EndpointDescriptor>();
				if (ep.Attributes == EndpointAttribute::bulk)
					ep.MaxPacketSize = (uint16_t)value;
			}
		}
	}

	std::optional<std::vector<uint8_t>> Descriptor::find(uint8_t type, uint8_t index) const
	{
		if (type != DescriptorTypeId::configuration)
		{
			for (const DescriptorEntry &e : m_entries)
				if (e.type() == type && e.index == index)
					return e.data;
			return std::nullopt;
		}

		std::optional<std::vector<uint8_t>> result;
		for (const DescriptorEntry &e : m_entries)
		{
			if (e.type() == DescriptorTypeId::configuration || endsConfiguration(e.type()))
			{
				if (result)
					break;
				if (e.type() == DescriptorTypeId::configuration && e.index == index)
					result.emplace();
			}
			if (result)
				result->insert(result->end(), e.data.begin(), e.data.end());
		}
		return result;
	}

	bool Descriptor::hasConfiguration(uint8_t configurationValue) const
	{
		for (const DescriptorEntry &e : m_entries)
			if (e.type() == ConfigurationDescriptor::TYPE && e.decode<ConfigurationDescriptor>().ConfigurationValue == configurationValue)
				return true;
		return false;
	}

	DeviceDescriptor* Descriptor::device()
	{
		for (DescriptorEntry& e : m_entries)
			if (e.type() == DeviceDescriptor::TYPE)
				return &e.decode<DeviceDescriptor>();
		return nullptr;
	}

	const DeviceDescriptor* Descriptor::device() const
	{
		for (const DescriptorEntry& e : m_entries)
			if (e.type() == DeviceDescriptor::TYPE)
				return &e.decode<DeviceDescriptor>();
		return nullptr;
	}
}
