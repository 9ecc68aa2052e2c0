// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "HtmlProcessor.hxx"
#include "RewriteContext.hxx"
#include "CssRewrite.hxx"
#include "parser/XmlParser.hxx"
#include "uri/Resolve.hxx"
#include "escape/HTML.hxx"
#include "escape/String.hxx"
#include "io/Logger.hxx"
#include "util/CharUtil.hxx"
#include "util/StringSplit.hxx"
#include "util/StringStrip.hxx"

#include <algorithm>
#include <cstdint>
#include <vector>

using std::string_view_literals::operator""sv;

/**
 * Elements which get their contents parsed as "raw text", i.e. no
 * markup inside.
 */
[[gnu::pure]]
static bool
IsRawTextElement(std::string_view name) noexcept
{
	return name == "script"sv || name == "style"sv;
}

namespace {

class HtmlBaseFinder final : public XmlParserHandler {
	XmlParser parser{*this};

	bool in_base = false, raw_text = false;

public:
	std::optional<std::string> href;

	void Run(std::string_view document) noexcept {
		parser.Parse(document);
	}

	/* virtual methods from class XmlParserHandler */

	bool OnXmlTagStart(const XmlParserTag &tag) noexcept override {
		in_base = tag.type != XmlParserTagType::CLOSE &&
			tag.name == "base"sv;
		/* the tag type may still change to SHORT, so
		   OnXmlTagFinished() checks it again */
		raw_text = tag.type == XmlParserTagType::OPEN &&
			IsRawTextElement(tag.name);
		return in_base || raw_text;
	}

	bool OnXmlTagFinished(const XmlParserTag &tag) noexcept override {
		if (in_base)
			/* only the first <base> element counts */
			return false;

		if (raw_text && tag.type == XmlParserTagType::OPEN)
			parser.Script(tag.name);

		return true;
	}

	void OnXmlAttributeFinished(const XmlParserAttribute &attr) noexcept override {
		if (in_base && attr.name == "href"sv && !href)
			href = UnescapeToString(html_escape_class, attr.value);
	}

	void OnXmlCdata(std::string_view, bool, std::size_t) noexcept override {}
};

class HtmlProcessor final : public XmlParserHandler {
	const std::string_view document;
	const RewriteContext &ctx;

	XmlParser parser{*this};

	enum class Tag {
		NONE,
		A,
		AREA,
		LINK,
		IMG,
		SCRIPT,
		IFRAME,
		FORM,
		VIDEO,
		AUDIO,
		SOURCE,
		STYLE,
		OTHER,
	} tag = Tag::NONE;

	struct Replacement {
		std::size_t start, end;
		std::string text;
	};

	/**
	 * Replacements in document order.
	 */
	std::vector<Replacement> replacements;

	/**
	 * The offset where the contents of the current <style> element
	 * begin, or SIZE_MAX if we're not inside a <style> element.
	 */
	std::size_t style_start = SIZE_MAX;

	bool expired = false;

public:
	HtmlProcessor(std::string_view _document,
		      const RewriteContext &_ctx) noexcept
		:document(_document), ctx(_ctx) {}

	std::string Run() noexcept;

private:
	void Replace(std::size_t start, std::size_t end,
		     std::string &&text) noexcept {
		replacements.push_back({start, end, std::move(text)});
	}

	void ReplaceAttributeValue(const XmlParserAttribute &attr,
				   std::string_view value) noexcept;

	void FinishStyle(std::size_t end) noexcept;

	void RewriteUriAttribute(const XmlParserAttribute &attr) noexcept;
	void RewriteSrcsetAttribute(const XmlParserAttribute &attr) noexcept;
	void RewriteStyleAttribute(const XmlParserAttribute &attr) noexcept;

	[[gnu::pure]]
	static Tag ParseTag(std::string_view name) noexcept;

	/**
	 * Is this the attribute which holds the link of the current
	 * element?
	 */
	[[gnu::pure]]
	bool IsUriAttribute(std::string_view name) const noexcept;

	/**
	 * Does the current element support the "srcset" attribute?
	 */
	constexpr bool HasSrcset() const noexcept {
		return tag == Tag::IMG || tag == Tag::SOURCE;
	}

	/* virtual methods from class XmlParserHandler */
	bool OnXmlTagStart(const XmlParserTag &tag) noexcept override;
	bool OnXmlTagFinished(const XmlParserTag &tag) noexcept override;
	void OnXmlAttributeFinished(const XmlParserAttribute &attr) noexcept override;
	void OnXmlCdata(std::string_view text, bool escaped,
			std::size_t start) noexcept override;
};

} // anonymous namespace

inline HtmlProcessor::Tag
HtmlProcessor::ParseTag(std::string_view name) noexcept
{
	switch (name.front()) {
	case 'a':
		if (name == "a"sv)
			return Tag::A;
		else if (name == "area"sv)
			return Tag::AREA;
		else if (name == "audio"sv)
			return Tag::AUDIO;
		break;

	case 'f':
		if (name == "form"sv)
			return Tag::FORM;
		break;

	case 'i':
		if (name == "img"sv)
			return Tag::IMG;
		else if (name == "iframe"sv)
			return Tag::IFRAME;
		break;

	case 'l':
		if (name == "link"sv)
			return Tag::LINK;
		break;

	case 's':
		if (name == "script"sv)
			return Tag::SCRIPT;
		else if (name == "source"sv)
			return Tag::SOURCE;
		else if (name == "style"sv)
			return Tag::STYLE;
		break;

	case 'v':
		if (name == "video"sv)
			return Tag::VIDEO;
		break;
	}

	return Tag::OTHER;
}

inline bool
HtmlProcessor::IsUriAttribute(std::string_view name) const noexcept
{
	switch (tag) {
	case Tag::A:
	case Tag::AREA:
	case Tag::LINK:
		return name == "href"sv;

	case Tag::IMG:
		return name == "src"sv || name == "longdesc"sv;

	case Tag::SCRIPT:
	case Tag::IFRAME:
	case Tag::AUDIO:
	case Tag::SOURCE:
		return name == "src"sv;

	case Tag::FORM:
		return name == "action"sv;

	case Tag::VIDEO:
		return name == "poster"sv;

	case Tag::NONE:
	case Tag::STYLE:
	case Tag::OTHER:
		break;
	}

	return false;
}

void
HtmlProcessor::ReplaceAttributeValue(const XmlParserAttribute &attr,
				     std::string_view value) noexcept
{
	std::string text = EscapeToString(html_escape_class, value);

	if (attr.quote == 0) {
		/* the new value gets quotes; if the attribute had no
		   value at all, the equals sign is missing, too */
		const bool bare = attr.value_start == attr.name_start + attr.name.size();
		text.insert(0, bare ? "=\""sv : "\""sv);
		text.push_back('"');
	}

	Replace(attr.value_start, attr.value_end, std::move(text));
}

void
HtmlProcessor::FinishStyle(std::size_t end) noexcept
{
	const auto block = document.substr(style_start, end - style_start);
	if (auto css = CssRewriteUrls(block, ctx))
		Replace(style_start, end, std::move(*css));

	style_start = SIZE_MAX;
}

void
HtmlProcessor::RewriteUriAttribute(const XmlParserAttribute &attr) noexcept
{
	const auto value = UnescapeToString(html_escape_class, attr.value);
	if (auto uri = ctx.RewriteReference(value))
		ReplaceAttributeValue(attr, *uri);
}

void
HtmlProcessor::RewriteSrcsetAttribute(const XmlParserAttribute &attr) noexcept
{
	const auto value = UnescapeToString(html_escape_class, attr.value);

	std::string dest;
	std::string_view rest = value;

	while (true) {
		auto [candidate, next] = Split(rest, ',');
		candidate = Strip(candidate);

		/* split into URL and descriptor at the first run of
		   whitespace */
		const auto i = std::find_if(candidate.begin(), candidate.end(),
					    IsWhitespaceOrNull);
		const std::string_view url{candidate.begin(), i};
		const auto descriptor = StripLeft(std::string_view{i, candidate.end()});

		if (!dest.empty())
			dest.append(", "sv);

		if (auto new_url = ctx.RewriteReference(url))
			dest.append(*new_url);
		else
			dest.append(url);

		dest.push_back(' ');
		dest.append(descriptor);

		if (next.data() == nullptr)
			break;

		rest = next;
	}

	ReplaceAttributeValue(attr, dest);
}

void
HtmlProcessor::RewriteStyleAttribute(const XmlParserAttribute &attr) noexcept
{
	const auto value = UnescapeToString(html_escape_class, attr.value);
	if (auto css = CssRewriteUrls(value, ctx))
		ReplaceAttributeValue(attr, *css);
}

bool
HtmlProcessor::OnXmlTagStart(const XmlParserTag &xml_tag) noexcept
{
	if (ctx.IsExpired()) {
		/* parse the tag's attributes (ignoring them) so
		   OnXmlTagFinished() gets called, which stops the
		   parser */
		expired = true;
		tag = Tag::NONE;
		return true;
	}

	if (style_start != SIZE_MAX)
		/* this is the "</" which ends the <style> contents */
		FinishStyle(xml_tag.start);

	if (xml_tag.type == XmlParserTagType::CLOSE ||
	    xml_tag.type == XmlParserTagType::PI) {
		tag = Tag::NONE;
		return false;
	}

	tag = ParseTag(xml_tag.name);
	return true;
}

bool
HtmlProcessor::OnXmlTagFinished(const XmlParserTag &xml_tag) noexcept
{
	if (expired)
		return false;

	if (xml_tag.type == XmlParserTagType::OPEN) {
		if (tag == Tag::SCRIPT) {
			parser.Script(xml_tag.name);
		} else if (tag == Tag::STYLE) {
			parser.Script(xml_tag.name);
			style_start = xml_tag.end;
		}
	}

	tag = Tag::NONE;
	return true;
}

void
HtmlProcessor::OnXmlAttributeFinished(const XmlParserAttribute &attr) noexcept
{
	if (expired)
		return;

	if (attr.name == "style"sv)
		RewriteStyleAttribute(attr);
	else if (attr.name == "srcset"sv && HasSrcset())
		RewriteSrcsetAttribute(attr);
	else if (IsUriAttribute(attr.name))
		RewriteUriAttribute(attr);
}

void
HtmlProcessor::OnXmlCdata(std::string_view, bool, std::size_t) noexcept
{
	/* character data is copied verbatim; <style> contents are
	   handled as a whole by FinishStyle() */
}

std::string
HtmlProcessor::Run() noexcept
{
	if (parser.Parse(document) && style_start != SIZE_MAX)
		/* unterminated <style> element */
		FinishStyle(document.size());

	if (expired)
		LogConcat(2, "html", "Deadline expired after ",
			  replacements.size(),
			  " replacements; copying the rest of the document");

	std::string dest;
	dest.reserve(document.size() + document.size() / 4);

	std::size_t position = 0;
	for (const auto &i : replacements) {
		dest.append(document.substr(position, i.start - position));
		dest.append(i.text);
		position = i.end;
	}

	dest.append(document.substr(position));
	return dest;
}

std::optional<std::string>
FindHtmlBaseHref(std::string_view document) noexcept
{
	HtmlBaseFinder finder;
	finder.Run(document);
	return std::move(finder.href);
}

std::string
ProcessHtml(std::string_view document, RewriteContext &ctx) noexcept
{
	if (auto href = FindHtmlBaseHref(document)) {
		ctx.base_url = ResolveUri(*href, ctx.base_url);
		LogConcat(4, "html", "Base URL from <base>: ", ctx.base_url);
	}

	HtmlProcessor processor(document, ctx);
	return processor.Run();
}
