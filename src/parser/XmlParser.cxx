// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "XmlParser.hxx"
#include "HtmlChars.hxx"
#include "util/CharUtil.hxx"
#include "util/StringCompare.hxx"

#include <algorithm>

#include <string.h>

void
XmlParser::Script(std::string_view name) noexcept
{
	raw_text_name_length = std::min(name.size(), sizeof(raw_text_name));
	std::copy_n(name.begin(), raw_text_name_length, raw_text_name);
	state = State::SCRIPT;
}

/**
 * Does the given text (beginning right after a '<') start with the
 * closing tag of the current SCRIPT/STYLE element?
 */
inline bool
XmlParser::IsRawTextEnd(std::string_view rest) const noexcept
{
	const std::string_view name{raw_text_name, raw_text_name_length};

	if (rest.size() < 1 + name.size() || rest.front() != '/' ||
	    !StringStartsWithIgnoreCase(rest.substr(1), name))
		return false;

	rest.remove_prefix(1 + name.size());
	return rest.empty() || IsWhitespaceOrNull(rest.front()) ||
		rest.front() == '/' || rest.front() == '>';
}

inline void
XmlParser::InvokeAttributeFinished(std::string_view document) noexcept
{
	attr.name = {attr_name, attr_name_length};
	attr.value = document.substr(attr.value_start,
				     attr.value_end - attr.value_start);

	handler.OnXmlAttributeFinished(attr);
}

inline void
XmlParser::AttributeWithoutValue(std::string_view document,
				 std::size_t end) noexcept
{
	attr.value_start = attr.value_end = attr.end = end;
	attr.quote = 0;
	InvokeAttributeFinished(document);
}

inline bool
XmlParser::InvokeTagFinished(std::size_t end) noexcept
{
	tag.end = end;

	if (!handler.OnXmlTagFinished(tag)) {
		stopped = true;
		return false;
	}

	return true;
}

bool
XmlParser::Parse(std::string_view document) noexcept
{
	const char *const start = document.data();
	const char *const end = start + document.size();
	const char *buffer = start, *p;

	const auto offset = [start](const char *q){
		return std::size_t(q - start);
	};

	while (buffer < end && !stopped) {
		switch (state) {
		case State::NONE:
		case State::SCRIPT:
			/* find first character */
			p = (const char *)memchr(buffer, '<', end - buffer);
			if (p == nullptr) {
				handler.OnXmlCdata({buffer, end}, true,
						   offset(buffer));
				buffer = end;
				break;
			}

			if (p > buffer)
				handler.OnXmlCdata({buffer, p}, true,
						   offset(buffer));

			tag.start = offset(p);
			state = state == State::NONE
				? State::ELEMENT_NAME
				: State::SCRIPT_ELEMENT_NAME;
			tag_name_length = 0;
			tag.type = XmlParserTagType::OPEN;
			buffer = p + 1;
			break;

		case State::SCRIPT_ELEMENT_NAME:
			if (IsRawTextEnd({buffer, std::size_t(end - buffer)})) {
				state = State::ELEMENT_NAME;
				tag.type = XmlParserTagType::CLOSE;
				++buffer;
			} else {
				/* any other '<' (including "</" of a
				   different element) is part of the
				   text */
				handler.OnXmlCdata("<", true, tag.start);
				state = State::SCRIPT;
			}

			break;

		case State::ELEMENT_NAME:
			/* copy element name */
			while (buffer < end) {
				if (IsHtmlNameChar(*buffer)) {
					if (tag_name_length == sizeof(tag_name)) {
						/* name buffer overflowing */
						state = State::NONE;
						break;
					}

					tag_name[tag_name_length++] = ToLowerASCII(*buffer++);
				} else if (*buffer == '/' && tag_name_length == 0) {
					tag.type = XmlParserTagType::CLOSE;
					++buffer;
				} else if (*buffer == '?' && tag_name_length == 0) {
					/* start of processing instruction */
					tag.type = XmlParserTagType::PI;
					++buffer;
				} else if ((IsWhitespaceOrNull(*buffer) || *buffer == '/' ||
					    *buffer == '?' || *buffer == '>') &&
					   tag_name_length > 0) {
					tag.name = {tag_name, tag_name_length};

					const bool interesting = handler.OnXmlTagStart(tag);

					state = interesting
						? State::ELEMENT_TAG
						: State::ELEMENT_BORING;
					break;
				} else if (*buffer == '!' && tag_name_length == 0) {
					state = State::DECLARATION_NAME;
					++buffer;
					break;
				} else {
					/* not a tag: the '<' is character data */
					handler.OnXmlCdata({start + tag.start, buffer},
							   true, tag.start);
					state = State::NONE;
					break;
				}
			}

			break;

		case State::ELEMENT_TAG:
			do {
				if (IsWhitespaceOrNull(*buffer)) {
					++buffer;
				} else if (*buffer == '/' && tag.type == XmlParserTagType::OPEN) {
					tag.type = XmlParserTagType::SHORT;
					state = State::SHORT;
					++buffer;
					break;
				} else if (*buffer == '?' && tag.type == XmlParserTagType::PI) {
					state = State::SHORT;
					++buffer;
					break;
				} else if (*buffer == '>') {
					state = State::NONE;
					++buffer;
					InvokeTagFinished(offset(buffer));
					break;
				} else if (IsHtmlNameStartChar(*buffer)) {
					state = State::ATTR_NAME;
					attr.name_start = offset(buffer);
					attr_name_length = 0;
					break;
				} else {
					/* ignore this syntax error and just close the
					   element tag */

					state = State::NONE;
					InvokeTagFinished(offset(buffer));
					break;
				}
			} while (buffer < end);

			break;

		case State::ELEMENT_BORING:
			/* ignore this tag */

			p = (const char *)memchr(buffer, '>', end - buffer);
			if (p != nullptr) {
				/* the "boring" tag has been closed */
				buffer = p + 1;
				state = State::NONE;
			} else
				buffer = end;
			break;

		case State::ATTR_NAME:
			/* copy attribute name */
			do {
				if (IsHtmlNameChar(*buffer)) {
					if (attr_name_length == sizeof(attr_name)) {
						/* name buffer overflowing */
						state = State::ELEMENT_TAG;
						break;
					}

					attr_name[attr_name_length++] = ToLowerASCII(*buffer++);
				} else if (*buffer == '=' || IsWhitespaceOrNull(*buffer)) {
					state = State::AFTER_ATTR_NAME;
					break;
				} else {
					AttributeWithoutValue(document, offset(buffer));
					state = State::ELEMENT_TAG;
					break;
				}
			} while (buffer < end);

			break;

		case State::AFTER_ATTR_NAME:
			/* wait till we find '=' */
			do {
				if (*buffer == '=') {
					state = State::BEFORE_ATTR_VALUE;
					++buffer;
					break;
				} else if (IsWhitespaceOrNull(*buffer)) {
					++buffer;
				} else {
					AttributeWithoutValue(document,
							      attr.name_start + attr_name_length);
					state = State::ELEMENT_TAG;
					break;
				}
			} while (buffer < end);

			break;

		case State::BEFORE_ATTR_VALUE:
			do {
				if (*buffer == '"' || *buffer == '\'') {
					state = State::ATTR_VALUE;
					attr.quote = *buffer;
					++buffer;
					attr.value_start = offset(buffer);
					break;
				} else if (IsWhitespaceOrNull(*buffer)) {
					++buffer;
				} else if (*buffer == '>') {
					/* "name=" without a value */
					AttributeWithoutValue(document, offset(buffer));
					state = State::ELEMENT_TAG;
					break;
				} else {
					state = State::ATTR_VALUE_COMPAT;
					attr.quote = 0;
					attr.value_start = offset(buffer);
					break;
				}
			} while (buffer < end);

			break;

		case State::ATTR_VALUE:
			/* wait till we find the delimiter */
			p = (const char *)memchr(buffer, attr.quote, end - buffer);
			if (p == nullptr) {
				/* unterminated value: give up on this tag */
				buffer = end;
			} else {
				buffer = p + 1;
				attr.value_end = offset(p);
				attr.end = offset(buffer);
				InvokeAttributeFinished(document);
				state = State::ELEMENT_TAG;
			}

			break;

		case State::ATTR_VALUE_COMPAT:
			/* wait till the value is finished */
			do {
				if (!IsWhitespaceOrNull(*buffer) && *buffer != '>') {
					++buffer;
				} else {
					attr.value_end = attr.end = offset(buffer);
					InvokeAttributeFinished(document);
					state = State::ELEMENT_TAG;
					break;
				}
			} while (buffer < end);

			break;

		case State::SHORT:
			do {
				if (IsWhitespaceOrNull(*buffer)) {
					++buffer;
				} else if (*buffer == '>') {
					state = State::NONE;
					++buffer;
					InvokeTagFinished(offset(buffer));
					break;
				} else {
					/* ignore this syntax error and just close the
					   element tag */

					state = State::NONE;
					InvokeTagFinished(offset(buffer));
					break;
				}
			} while (buffer < end);

			break;

		case State::DECLARATION_NAME:
			/* copy declaration element name */
			while (buffer < end) {
				if (IsAlphaNumericASCII(*buffer) || *buffer == ':' ||
				    *buffer == '-' || *buffer == '_' || *buffer == '[') {
					if (tag_name_length == sizeof(tag_name)) {
						/* name buffer overflowing */
						state = State::NONE;
						break;
					}

					tag_name[tag_name_length++] = ToLowerASCII(*buffer++);

					if (tag_name_length == 7 &&
					    memcmp(tag_name, "[cdata[", 7) == 0) {
						state = State::CDATA_SECTION;
						break;
					}

					if (tag_name_length == 2 &&
					    memcmp(tag_name, "--", 2) == 0) {
						state = State::COMMENT;
						minus_count = 0;
						break;
					}
				} else {
					/* DOCTYPE and friends */
					state = State::ELEMENT_BORING;
					break;
				}
			}

			break;

		case State::CDATA_SECTION:
			/* the whole document is available, so the end marker
			   can be searched for directly */
			{
				const std::string_view rest{buffer, std::size_t(end - buffer)};
				const auto i = rest.find("]]>");
				const auto text = rest.substr(0, i);
				if (!text.empty())
					handler.OnXmlCdata(text, false, offset(buffer));

				if (i == rest.npos) {
					buffer = end;
				} else {
					buffer += i + 3;
					state = State::NONE;
				}
			}

			break;

		case State::COMMENT:
			switch (minus_count) {
			case 0:
				/* find a minus which introduces the "-->" sequence */
				p = (const char *)memchr(buffer, '-', end - buffer);
				if (p != nullptr) {
					/* found one - minus_count=1 and go to char after
					   minus */
					buffer = p + 1;
					minus_count = 1;
				} else
					/* none found - skip the rest */
					buffer = end;

				break;

			case 1:
				if (*buffer == '-')
					/* second minus found */
					minus_count = 2;
				else
					minus_count = 0;
				++buffer;

				break;

			case 2:
				if (*buffer == '>') {
					/* end of comment */
					state = State::NONE;
					++buffer;
				} else if (*buffer == '-')
					/* another minus... keep minus_count at 2 and go
					   to next character */
					++buffer;
				else
					minus_count = 0;

				break;
			}

			break;
		}
	}

	return !stopped;
}
