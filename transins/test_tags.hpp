// -*- mode: c++ -*-
//
//  Copyright(C) 2020 transins developers
//

#ifndef __TRANSINS__TEST_TAGS__HPP__
#define __TRANSINS__TEST_TAGS__HPP__ 1

// named tags for unit tests. OPEN1 ... CLOSE3 form three tag pairs,
// ISO1 and ISO2 are isolated. ids follow the order of the names, so
// that new isolated tags derived from OPEN1 ... CLOSE3 are ISO1, ISO2.

#include <string>

#include <transins/tag.hpp>
#include <transins/tokens.hpp>
#include <transins/tag_map.hpp>

namespace transins
{
  namespace test
  {
    struct names_type
    {
      const char* name;
      Tag::kind_type kind;
      Tag::id_type id;
    };

    inline
    const names_type* names()
    {
      static const names_type __names[] = {
	{"OPEN1",  Tag::OPENING,  0},
	{"CLOSE1", Tag::CLOSING,  1},
	{"OPEN2",  Tag::OPENING,  2},
	{"CLOSE2", Tag::CLOSING,  3},
	{"OPEN3",  Tag::OPENING,  4},
	{"CLOSE3", Tag::CLOSING,  5},
	{"ISO1",   Tag::ISOLATED, 6},
	{"ISO2",   Tag::ISOLATED, 7},
	{0, Tag::NONE, -1},
      };
      return __names;
    }

    inline
    token_type tag(const std::string& name)
    {
      for (const names_type* iter = names(); iter->name; ++ iter)
	if (name == iter->name)
	  return Tag(iter->kind, iter->id).token();
      return name;
    }

    // tokens with tag names replaced by tags
    inline
    tokens_type tokens(const std::string& line)
    {
      tokens_type result;
      split(line, result);

      tokens_type::iterator titer_end = result.end();
      for (tokens_type::iterator titer = result.begin(); titer != titer_end; ++ titer)
	*titer = tag(*titer);

      return result;
    }

    inline
    std::string line(const std::string& named)
    {
      return join(tokens(named));
    }

    // tokens with tags replaced by their names
    inline
    std::string names(const tokens_type& tokens)
    {
      std::string joined;

      tokens_type::const_iterator titer_end = tokens.end();
      for (tokens_type::const_iterator titer = tokens.begin(); titer != titer_end; ++ titer) {
	if (titer != tokens.begin())
	  joined += ' ';

	const Tag tag(*titer);
	const names_type* iter = names();
	for (/**/; iter->name; ++ iter)
	  if (tag.kind() == iter->kind && tag.id() == iter->id)
	    break;

	joined += (iter->name ? std::string(iter->name) : *titer);
      }

      return joined;
    }

    inline
    TagMap tag_map()
    {
      TagMap tag_map;
      tag_map.put(tag("OPEN1"), tag("CLOSE1"));
      tag_map.put(tag("OPEN2"), tag("CLOSE2"));
      tag_map.put(tag("OPEN3"), tag("CLOSE3"));
      return tag_map;
    }
  };
};

#endif
