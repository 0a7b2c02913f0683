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

#include "EndpointAddress.h"
#include "../utils/Exceptions.h"

#include <cstdint>
#include <cstring>
#include <optional>
#include <string_view>
#include <type_traits>
#include <vector>

namespace usblink::usb
{
	template<typename T>
	concept DescriptorType = std::is_aggregate_v<T> && requires() { T::TYPE; };

	namespace ClassCode
	{
		enum
		{
			Interface_Descriptors = 0x00,
			Audio = 0x01,
			Communications_and_CDC_Control = 0x02,
			Human_Interface_Device = 0x03,
			Mass_Storage = 0x08,
			Hub = 0x09,
			CDC_Data = 0x0A,
			Video = 0x0E,
			Miscellaneous = 0xEF,
			Application_Specific = 0xFE,
			Vendor_Specific = 0xFF,
		};
	}

	namespace DescriptorTypeId
	{
		enum : uint8_t
		{
			device = 1,
			configuration = 2,
			string = 3,
			interface = 4,
			endpoint = 5,
			deviceQualifier = 6,
			otherSpeedConfiguration = 7,
			interfaceAssociation = 11,
		};
	}

#pragma pack(push, 1)
	struct StringId
	{
		uint8_t id = 0;
	};

	struct DeviceDescriptor
	{
		enum { TYPE = DescriptorTypeId::device };

		uint16_t USB = 0x200; // BCD USB 2.0

		// usually set at interface level
		uint8_t Class = 0;
		uint8_t SubClass = 0;
		uint8_t Protocol = 0;

		uint8_t MaxPacketSize = 64; // of endpoint 0: 8, 16, 32 or 64

		// openmoko vendor id for foss designs
		uint16_t Vendor = 0x1d50;
		uint16_t Product = 0;

		uint16_t Device = 0x100; // BCD Device Release Number

		// make sure to add string descriptors for each used string
		StringId ManufacturerName;
		StringId ProductName;
		StringId SerialNumber;

		uint8_t NumConfigurations = 0;
	};

	/// Describes the device as it would operate at the other speed, requested by high speed hosts.
	struct DeviceQualifierDescriptor
	{
		enum { TYPE = DescriptorTypeId::deviceQualifier };

		uint16_t USB = 0x200;
		uint8_t Class = 0;
		uint8_t SubClass = 0;
		uint8_t Protocol = 0;
		uint8_t MaxPacketSize = 64;
		uint8_t NumConfigurations = 0;
		uint8_t Reserved = 0;
	};

	namespace ConfigurationAttributes
	{
		enum {
			RemoteWakeup = 1 << 5,
			SelfPowered = 1 << 6,
			Reserved = 1 << 7,
		};
	}

	struct ConfigurationDescriptor
	{
		enum { TYPE = DescriptorTypeId::configuration };

		uint16_t TotalLength = 0; // including all sub descriptors
		uint8_t NumInterfaces = 0;
		uint8_t ConfigurationValue = 0;
		StringId Name;
		uint8_t Attributes = ConfigurationAttributes::Reserved;
		uint8_t MaxPower = 50; // *2 mA
	};

	struct InterfaceAssociationDescriptor
	{
		enum {
			TYPE = DescriptorTypeId::interfaceAssociation,
			DevClass = ClassCode::Miscellaneous,
			DevSubClass = 2,
			DevProtocol = 1,
		};

		uint8_t FirstInterface = 0;
		uint8_t InterfaceCount = 0;

		// set equal to first interface values
		uint8_t FunctionClass = 0;
		uint8_t FunctionSubClass = 0;

		uint8_t FunctionProtocol = 0;
		StringId Name;
	};

	struct InterfaceDescriptor
	{
		enum { TYPE = DescriptorTypeId::interface };

		uint8_t InterfaceNumber = 0;
		uint8_t AlternateSetting = 0;
		uint8_t NumEndpoints = 0;
		uint8_t Class = 0;
		uint8_t SubClass = 0;
		uint8_t Protocol = 0;
		StringId Name;
	};

	namespace EndpointAttribute
	{
		enum {
			control = 0,
			isochronous = 1,
			bulk = 2,
			interrupt = 3,
		};
	}

	struct EndpointDescriptor
	{
		enum { TYPE = DescriptorTypeId::endpoint };

		uint8_t Address = 0; // EndpointAddress::encode()
		uint8_t Attributes = EndpointAttribute::bulk;
		uint16_t MaxPacketSize = 64;
		uint8_t Interval = 1; // interrupt poll interval
	};
#pragma pack(pop)

	enum class LangID
	{
		Chinese_PRC = 0x0804,
		English_United_States = 0x0409,
		English_United_Kingdom = 0x0809,
		French_Standard = 0x040c,
		German_Standard = 0x0407,
		Italian_Standard = 0x0410,
		Japanese = 0x0411,
		Korean = 0x0412,
		Spanish_Modern_Sort = 0x0c0a,
		HID_Usage_Data_Descriptor = 0x04ff,
	};

	struct DescriptorEntry
	{
		uint8_t type() const { return data[1]; }

		uint8_t index;
		std::optional<LangID> language;
		std::vector<uint8_t> data;

		template<DescriptorType T> T& decode();
		template<DescriptorType T> const T& decode() const;
	};

	/**
	 * @brief Ordered collection of all descriptors served by the standard request handler.
	 * @details Descriptors are kept in the order in which they are reported inside a
	 * configuration: a configuration descriptor is followed by its interfaces and endpoints
	 * until the next configuration. String descriptors are kept at the end.
	 */
	class Descriptor
	{
	public:
		void add(StringId index, std::wstring_view string, LangID language = LangID::English_United_States);
		void add(std::vector<uint8_t>&& data, uint8_t index = 0);

		template<DescriptorType T>
		void add(T descriptor, uint8_t index = 0);

		StringId allocateStringIndex() { return StringId{ m_nextStringIndex++ }; }
		StringId allocateStringIndex(std::wstring_view string, LangID language = LangID::English_United_States);

		/// Fixes numbers, counts and sizes. Fields that are already set are kept.
		void finalize();
		/// Changes the max packet size of all bulk endpoints and of endpoint 0 as far as permitted.
		void changeMaxPacketSize(size_t value);

		const std::vector<DescriptorEntry>& entries() const { return m_entries; }

		/**
		 * @brief Bytes returned for GET_DESCRIPTOR.
		 * @details A configuration is returned together with all its subordinate descriptors.
		 * String descriptors are matched by index only.
		 */
		std::optional<std::vector<uint8_t>> find(uint8_t type, uint8_t index) const;
		bool hasConfiguration(uint8_t configurationValue) const;

		DeviceDescriptor* device();
		const DeviceDescriptor* device() const;
	private:
		std::vector<DescriptorEntry> m_entries;
		uint8_t m_nextStringIndex = 1;
	};



	template<DescriptorType T>
	inline void Descriptor::add(T descriptor, uint8_t index)
	{
		std::vector<uint8_t> data(sizeof(descriptor) + 2, 0);
		data[0] = (uint8_t)data.size();
		data[1] = decltype(descriptor)::TYPE;
		memcpy(&data[2], &descriptor, sizeof(descriptor));
		add(std::move(data), index);
	}

	template<DescriptorType T>
	inline T& DescriptorEntry::decode()
	{
		USBLINK_DESIGNCHECK_HINT(sizeof(T) == data.size() - 2, "wrong descriptor size");
		USBLINK_DESIGNCHECK_HINT(T::TYPE == data[1], "wrong descriptor type");
		return *(T*)&data[2];
	}

	template<DescriptorType T>
	inline const T& DescriptorEntry::decode() const
	{
		USBLINK_DESIGNCHECK_HINT(sizeof(T) == data.size() - 2, "wrong descriptor size");
		USBLINK_DESIGNCHECK_HINT(T::TYPE == data[1], "wrong descriptor type");
		return *(const T*)&data[2];
	}
}
