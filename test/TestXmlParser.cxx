// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "parser/XmlParser.hxx"

#include <gtest/gtest.h>

#include <string>

using std::string_view_literals::operator""sv;

namespace {

/**
 * Records all parser events in a compact text form.
 */
class RecordingXmlHandler final : public XmlParserHandler {
	XmlParser parser{*this};

	bool raw_text = false;

public:
	std::string events;

	bool Parse(std::string_view document) noexcept {
		return parser.Parse(document);
	}

	/* virtual methods from class XmlParserHandler */

	bool OnXmlTagStart(const XmlParserTag &tag) noexcept override {
		switch (tag.type) {
		case XmlParserTagType::OPEN:
			events += "<";
			break;

		case XmlParserTagType::CLOSE:
			events += "</";
			break;

		case XmlParserTagType::SHORT:
			events += "<";
			break;

		case XmlParserTagType::PI:
			events += "<?";
			break;
		}

		events += tag.name;
		raw_text = tag.name == "script"sv || tag.name == "style"sv;
		return tag.name != "boring"sv;
	}

	bool OnXmlTagFinished(const XmlParserTag &tag) noexcept override {
		events += tag.type == XmlParserTagType::SHORT ? "/>" : ">";
		events += std::to_string(tag.start);
		events += '-';
		events += std::to_string(tag.end);

		if (raw_text && tag.type == XmlParserTagType::OPEN)
			parser.Script(tag.name);

		return tag.name != "stop"sv;
	}

	void OnXmlAttributeFinished(const XmlParserAttribute &attr) noexcept override {
		events += ' ';
		events += attr.name;
		events += '=';
		if (attr.quote != 0)
			events += attr.quote;
		events += attr.value;
		if (attr.quote != 0)
			events += attr.quote;
	}

	void OnXmlCdata(std::string_view text, bool escaped,
			std::size_t) noexcept override {
		events += escaped ? "[" : "[[";
		events += text;
		events += escaped ? "]" : "]]";
	}
};

} // anonymous namespace

static std::string
Parse(std::string_view document)
{
	RecordingXmlHandler handler;
	handler.Parse(document);
	return std::move(handler.events);
}

TEST(XmlParser, Tags)
{
	EXPECT_EQ(Parse("<p>text</p>"sv), "<p>0-3[text]</p>7-11"sv);
	EXPECT_EQ(Parse("<BR/>"sv), "<br/>0-5"sv);
	EXPECT_EQ(Parse("<?xml version=\"1.0\"?>"sv),
		  "<?xml version=\"1.0\">0-21"sv);
}

TEST(XmlParser, Attributes)
{
	EXPECT_EQ(Parse("<a HREF=\"x\" b='y' c=z d e=>"sv),
		  "<a href=\"x\" b='y' c=z d= e=>0-27"sv);
	EXPECT_EQ(Parse("<a b = \"x y\" >"sv), "<a b=\"x y\">0-14"sv);
}

TEST(XmlParser, AttributeOffsets)
{
	struct Handler final : XmlParserHandler {
		XmlParserAttribute last{};

		bool OnXmlTagStart(const XmlParserTag &) noexcept override {
			return true;
		}

		bool OnXmlTagFinished(const XmlParserTag &) noexcept override {
			return true;
		}

		void OnXmlAttributeFinished(const XmlParserAttribute &attr) noexcept override {
			last = attr;
		}

		void OnXmlCdata(std::string_view, bool, std::size_t) noexcept override {}
	} handler;

	XmlParser parser(handler);
	parser.Parse("<img src=\"abc\">"sv);

	EXPECT_EQ(handler.last.name_start, 5u);
	EXPECT_EQ(handler.last.value_start, 10u);
	EXPECT_EQ(handler.last.value_end, 13u);
	EXPECT_EQ(handler.last.end, 14u);
	EXPECT_EQ(handler.last.quote, '"');
}

TEST(XmlParser, Boring)
{
	EXPECT_EQ(Parse("<boring a=\"b\">x"sv), "<boring[x]"sv);
	EXPECT_EQ(Parse("<!DOCTYPE html><p>"sv), "<p>15-18"sv);
}

TEST(XmlParser, Comment)
{
	EXPECT_EQ(Parse("a<!-- <p> - -- -->b"sv), "[a][b]"sv);
	EXPECT_EQ(Parse("<!-- unterminated <p>"sv), ""sv);
}

TEST(XmlParser, Cdata)
{
	EXPECT_EQ(Parse("<![CDATA[<p>&amp;]]><i>"sv), "[[<p>&amp;]]<i>20-23"sv);
}

TEST(XmlParser, Script)
{
	EXPECT_EQ(Parse("<script>a<b</script>"sv),
		  "<script>0-8[a][<][b]</script>11-20"sv);
	EXPECT_EQ(Parse("<script/><p>"sv), "<script/>0-9<p>9-12"sv);
}

TEST(XmlParser, ScriptOtherClosingTag)
{
	EXPECT_EQ(Parse("<script>a</div><p>b</script>"sv),
		  "<script>0-8[a][<][/div>][<][p>b]</script>19-28"sv);
	EXPECT_EQ(Parse("<script>x(\"</\"+\"script>\")</script>"sv),
		  "<script>0-8[x(\"][<][/\"+\"script>\")]</script>25-34"sv);
}

TEST(XmlParser, StyleClosingTag)
{
	EXPECT_EQ(Parse("<style>a</styles>b</STYLE>"sv),
		  "<style>0-7[a][<][/styles>b]</style>18-26"sv);
	EXPECT_EQ(Parse("<style>a</style\n>"sv),
		  "<style>0-7[a]</style>8-17"sv);
}

TEST(XmlParser, NotATag)
{
	EXPECT_EQ(Parse("1 < 2"sv), "[1 ][<][ 2]"sv);
	EXPECT_EQ(Parse("<>"sv), "[<][>]"sv);
}

TEST(XmlParser, Stop)
{
	RecordingXmlHandler handler;
	EXPECT_FALSE(handler.Parse("<stop><p>"sv));
	EXPECT_EQ(handler.events, "<stop>0-6"sv);
}
