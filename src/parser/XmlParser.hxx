// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * A forgiving tokenizer for HTML/XML documents.  It does not build a
 * tree; it reports tags, attributes and character data together with
 * their byte offsets, so a caller can replace ranges of the source.
 */

#pragma once

#include <cstddef>
#include <string_view>

enum class XmlParserTagType {
	OPEN,
	CLOSE,
	SHORT,

	/** XML processing instruction */
	PI,
};

struct XmlParserTag {
	std::size_t start, end;

	/**
	 * The element name, converted to lower case.
	 */
	std::string_view name;

	XmlParserTagType type;
};

struct XmlParserAttribute {
	std::size_t name_start, value_start, value_end, end;

	/**
	 * The attribute name, converted to lower case.
	 */
	std::string_view name;

	/**
	 * The raw (still HTML-escaped) value.
	 */
	std::string_view value;

	/**
	 * The quote character which delimits the value, or 0 if the
	 * value was not quoted (or if the attribute has no value).
	 */
	char quote;
};

class XmlParserHandler {
public:
	/**
	 * A tag has started, and we already know its name.
	 *
	 * @return true if attributes should be parsed, false otherwise
	 * (saves CPU cycles; OnXmlTagFinished() is not called)
	 */
	virtual bool OnXmlTagStart(const XmlParserTag &tag) noexcept = 0;

	/**
	 * @return false to stop parsing
	 */
	virtual bool OnXmlTagFinished(const XmlParserTag &tag) noexcept = 0;

	virtual void OnXmlAttributeFinished(const XmlParserAttribute &attr) noexcept = 0;

	/**
	 * @param escaped true if the text may contain HTML entities
	 * (false inside a CDATA section)
	 * @param start the offset of the text in the document
	 */
	virtual void OnXmlCdata(std::string_view text, bool escaped,
				std::size_t start) noexcept = 0;
};

class XmlParser {
	/* internal state */
	enum class State {
		NONE,

		/** within a SCRIPT/STYLE element; only the closing tag
		    of that element breaks out */
		SCRIPT,

		/** found '<' within a SCRIPT element */
		SCRIPT_ELEMENT_NAME,

		/** parsing an element name */
		ELEMENT_NAME,

		/** inside the element tag */
		ELEMENT_TAG,

		/** inside the element tag, but ignore attributes */
		ELEMENT_BORING,

		/** parsing attribute name */
		ATTR_NAME,

		/** after the attribute name, waiting for '=' */
		AFTER_ATTR_NAME,

		/** after the '=', waiting for the attribute value */
		BEFORE_ATTR_VALUE,

		/** parsing the quoted attribute value */
		ATTR_VALUE,

		/** compatibility with older and broken HTML: attribute value
		    without quotes */
		ATTR_VALUE_COMPAT,

		/** found a slash, waiting for the '>' */
		SHORT,

		/** parsing a declaration name beginning with "<!" */
		DECLARATION_NAME,

		/** within a CDATA section */
		CDATA_SECTION,

		/** within a comment */
		COMMENT,
	} state = State::NONE;

	/* the name of the SCRIPT/STYLE element whose content is being
	   parsed */
	char raw_text_name[16];
	std::size_t raw_text_name_length = 0;

	/* element */
	XmlParserTag tag;
	char tag_name[64];
	std::size_t tag_name_length;

	/* attribute */
	char attr_name[64];
	std::size_t attr_name_length;
	XmlParserAttribute attr;

	/** in a comment, how many consecutive minus are there? */
	unsigned minus_count;

	bool stopped = false;

	XmlParserHandler &handler;

public:
	explicit XmlParser(XmlParserHandler &_handler) noexcept
		:handler(_handler) {}

	XmlParser(const XmlParser &) = delete;
	XmlParser &operator=(const XmlParser &) = delete;

	/**
	 * Parse a complete document.  This may be called only once.
	 *
	 * @return false if the handler has stopped the parser
	 */
	bool Parse(std::string_view document) noexcept;

	/**
	 * Switch to "raw text" mode: everything until the closing tag
	 * of the given element ("</name" followed by whitespace, '/'
	 * or '>') is character data.  Call this from
	 * OnXmlTagFinished() after the opening tag of a SCRIPT or STYLE
	 * element.
	 *
	 * @param name the (lower case) element name
	 */
	void Script(std::string_view name) noexcept;

private:
	void InvokeAttributeFinished(std::string_view document) noexcept;
	bool InvokeTagFinished(std::size_t end) noexcept;

	[[gnu::pure]]
	bool IsRawTextEnd(std::string_view rest) const noexcept;

	void AttributeWithoutValue(std::string_view document,
				   std::size_t end) noexcept;
};
