/*
 *	Client interface for local Samsung TV access
 *
 *	Minimal XML element tree built with expat
 *
 *
 *	Copyright 2022-2026 - gordonb3 https://github.com/gordonb3/tuyapp
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://github.com/gordonb3/tuyapp/blob/master/LICENSE>
 */

#include "samsungXML.hpp"
#include "samsungErrors.hpp"
#include <expat.h>
#include <memory>
#include <cstdlib>
#include <cstring>


namespace {

struct TreeBuilder
{
	Samsung::XML::Node root;
	std::vector<Samsung::XML::Node*> stack;
	bool complete = false;
};


std::string LocalName(const XML_Char *szName)
{
	const char *separator = strchr(szName, ':');
	if (separator)
		return std::string(separator + 1);
	return std::string(szName);
}


bool IsWhitespace(const std::string &szText)
{
	return szText.find_first_not_of(" \t\r\n") == std::string::npos;
}


void XMLCALL start_element(void *user_data, const XML_Char *element_name, const XML_Char **atts)
{
	TreeBuilder *builder = (TreeBuilder *)user_data;

	Samsung::XML::Node node;
	node.name = LocalName(element_name);
	for (int i = 0; atts[i] != nullptr; i += 2)
		node.attributes.push_back(std::make_pair(std::string(atts[i]), std::string(atts[i + 1])));

	if (builder->stack.empty())
	{
		builder->root = node;
		builder->stack.push_back(&builder->root);
		return;
	}

	// only the innermost open element grows, so pointers held for its ancestors stay valid
	Samsung::XML::Node *parent = builder->stack.back();
	parent->children.push_back(node);
	builder->stack.push_back(&parent->children.back());
}


void XMLCALL end_element(void *user_data, const XML_Char *element_name)
{
	(void)element_name;
	TreeBuilder *builder = (TreeBuilder *)user_data;
	if (builder->stack.empty())
		return;

	Samsung::XML::Node *node = builder->stack.back();
	if (IsWhitespace(node->text))
		node->text.clear();
	builder->stack.pop_back();
	if (builder->stack.empty())
		builder->complete = true;
}


void XMLCALL character_data(void *user_data, const XML_Char *s, int len)
{
	TreeBuilder *builder = (TreeBuilder *)user_data;
	if (!builder->stack.empty())
		builder->stack.back()->text.append(s, len);
}

}; // namespace


const Samsung::XML::Node *Samsung::XML::Node::Find(const std::string &szName) const
{
	for (size_t i = 0; i < children.size(); i++)
	{
		if (children[i].name == szName)
			return &children[i];
	}
	return nullptr;
}


std::string Samsung::XML::Node::FindText(const std::string &szName, const std::string &szDefault) const
{
	const Node *child = Find(szName);
	if (child == nullptr)
		return szDefault;
	return child->text;
}


Samsung::XML::Node Samsung::XML::Parse(const std::string &szDocument)
{
	std::unique_ptr<XML_ParserStruct, void (*)(XML_Parser)> parser(XML_ParserCreate(nullptr), XML_ParserFree);
	if (!parser)
		throw Samsung::XMLError("unable to create parser");

	TreeBuilder builder;
	XML_SetUserData(parser.get(), &builder);
	XML_SetElementHandler(parser.get(), start_element, end_element);
	XML_SetCharacterDataHandler(parser.get(), character_data);

	if (XML_Parse(parser.get(), szDocument.c_str(), (int)szDocument.length(), 1) != XML_STATUS_OK)
	{
		std::string szError = XML_ErrorString(XML_GetErrorCode(parser.get()));
		szError.append(" at line ");
		szError.append(std::to_string(XML_GetCurrentLineNumber(parser.get())));
		throw Samsung::XMLError(szError);
	}
	if (!builder.complete)
		throw Samsung::XMLError("no document element");
	return builder.root;
}


std::string Samsung::XML::Serialize(const Node &node)
{
	std::string szResult = "<" + node.name;
	for (size_t i = 0; i < node.attributes.size(); i++)
		szResult.append(" " + node.attributes[i].first + "=\"" + Escape(node.attributes[i].second) + "\"");

	if (node.text.empty() && node.children.empty())
		return szResult + "/>";

	szResult.append(">");
	szResult.append(Escape(node.text));
	for (size_t i = 0; i < node.children.size(); i++)
		szResult.append(Serialize(node.children[i]));
	szResult.append("</" + node.name + ">");
	return szResult;
}


std::string Samsung::XML::Escape(const std::string &szText)
{
	std::string szResult;
	szResult.reserve(szText.length());
	for (size_t i = 0; i < szText.length(); i++)
	{
		switch (szText[i])
		{
			case '&':
				szResult.append("&amp;");
				break;
			case '<':
				szResult.append("&lt;");
				break;
			case '>':
				szResult.append("&gt;");
				break;
			case '"':
				szResult.append("&quot;");
				break;
			case '\'':
				szResult.append("&apos;");
				break;
			default:
				szResult.append(1, szText[i]);
		}
	}
	return szResult;
}


std::string Samsung::XML::Unescape(const std::string &szText)
{
	static const struct {
		const char *entity;
		char value;
	} entities[] = {
		{ "&amp;", '&' },
		{ "&lt;", '<' },
		{ "&gt;", '>' },
		{ "&quot;", '"' },
		{ "&apos;", '\'' }
	};

	std::string szResult;
	szResult.reserve(szText.length());
	size_t bufferpos = 0;
	while (bufferpos < szText.length())
	{
		if (szText[bufferpos] != '&')
		{
			szResult.append(1, szText[bufferpos++]);
			continue;
		}

		bool matched = false;
		for (size_t i = 0; i < sizeof(entities) / sizeof(entities[0]); i++)
		{
			size_t entitysize = strlen(entities[i].entity);
			if (szText.compare(bufferpos, entitysize, entities[i].entity) == 0)
			{
				szResult.append(1, entities[i].value);
				bufferpos += entitysize;
				matched = true;
				break;
			}
		}
		if (matched)
			continue;

		// numeric character reference within the ASCII range
		size_t terminator = szText.find(';', bufferpos);
		if ((terminator != std::string::npos) && (szText.compare(bufferpos, 2, "&#") == 0) && (terminator > bufferpos + 2))
		{
			bool hex = (szText[bufferpos + 2] == 'x');
			std::string szNumber = szText.substr(bufferpos + (hex ? 3 : 2), terminator - bufferpos - (hex ? 3 : 2));
			char *end = nullptr;
			long code = strtol(szNumber.c_str(), &end, hex ? 16 : 10);
			if ((end != nullptr) && (*end == '\0') && (code > 0) && (code < 0x80))
			{
				szResult.append(1, (char)code);
				bufferpos = terminator + 1;
				continue;
			}
		}
		szResult.append(1, szText[bufferpos++]);
	}
	return szResult;
}
