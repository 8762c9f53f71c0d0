// -*- mode: c++ -*-
//
//  Copyright(C) 2020 transins developers
//

#ifndef __TRANSINS__TAG_MAP__HPP__
#define __TRANSINS__TAG_MAP__HPP__ 1

#include <cstddef>
#include <map>
#include <vector>
#include <utility>

#include <transins/tokens.hpp>

namespace transins
{
  // bidirectional map between the opening and the closing tag of each
  // tag pair in a sentence. pairs are kept in insertion order.
  
  class TagMap
  {
  public:
    typedef size_t size_type;
    
    typedef std::pair<token_type, token_type> value_type;
    
  private:
    typedef std::vector<value_type, std::allocator<value_type> > pair_set_type;
    typedef std::map<token_type, token_type, std::less<token_type>,
		     std::allocator<std::pair<const token_type, token_type> > > map_type;
    
  public:
    typedef pair_set_type::const_iterator const_iterator;
    typedef pair_set_type::const_iterator iterator;
    
  public:
    TagMap() {}
    // pair tags by a stack scan. throws MarkupInconsistency on a closing
    // tag without an opening tag, or an opening tag left unclosed.
    explicit TagMap(const tokens_type& tokens) { assign(tokens); }
    
  public:
    void assign(const tokens_type& tokens);
    void put(const token_type& opening, const token_type& closing);
    
    // empty when unknown
    const token_type& closing(const token_type& opening) const { return find(__closing, opening); }
    const token_type& opening(const token_type& closing) const { return find(__opening, closing); }
    
    const_iterator begin() const { return __pairs.begin(); }
    const_iterator end() const { return __pairs.end(); }
    
    size_type size() const { return __pairs.size(); }
    bool empty() const { return __pairs.empty(); }
    
    void clear()
    {
      __pairs.clear();
      __closing.clear();
      __opening.clear();
    }
    
  private:
    static const token_type& find(const map_type& map, const token_type& tag);
    
  private:
    pair_set_type __pairs;
    map_type      __closing;
    map_type      __opening;
  };
};

#endif
