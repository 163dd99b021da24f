/*
 *	Client interface for local Samsung TV access
 *
 *	Minimal XML element tree built with expat
 *
 *	Namespace prefixes are stripped from element names while parsing, so
 *	`<s:Envelope>` is found as "Envelope". Text that consists of whitespace
 *	only (indentation) is dropped.
 *
 *
 *	Copyright 2022-2026 - gordonb3 https://github.com/gordonb3/tuyapp
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://github.com/gordonb3/tuyapp/blob/master/LICENSE>
 */

#ifndef _samsungXML
#define _samsungXML

#include <string>
#include <vector>
#include <utility>


namespace Samsung {
  namespace XML {

	struct Node
	{
		std::string name;
		std::string text;
		std::vector<std::pair<std::string, std::string> > attributes;
		std::vector<Node> children;

		// first direct child with the given name, nullptr if there is none
		const Node *Find(const std::string &szName) const;
		std::string FindText(const std::string &szName, const std::string &szDefault = "") const;
		bool Has(const std::string &szName) const { return Find(szName) != nullptr; }
	};

	// throws Samsung::XMLError on malformed input
	Node Parse(const std::string &szDocument);

	std::string Serialize(const Node &node);
	std::string Escape(const std::string &szText);
	std::string Unescape(const std::string &szText);

  }; // namespace XML
}; // namespace Samsung

#endif // _samsungXML
