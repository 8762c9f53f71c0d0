// -*- mode: c++ -*-
//
//  Copyright(C) 2020 transins developers
//

#ifndef __TRANSINS__DOCUMENT__HPP__
#define __TRANSINS__DOCUMENT__HPP__ 1

// context of one document under translation: the reinsertion setting,
// the manually annotated alignments, the tagged translations and
// statistics. sentences of a document may be processed by several
// threads at once.

#include <string>
#include <vector>
#include <map>

#include <boost/shared_ptr.hpp>
#include <boost/thread/mutex.hpp>

#include <transins/tokens.hpp>
#include <transins/markup_reinserter.hpp>
#include <transins/alignment_table.hpp>

namespace transins
{
  class Document
  {
  public:
    typedef size_t size_type;
    typedef size_t id_type;
    
    typedef MarkupReinserter::strategy_type strategy_type;
    typedef MarkupReinserter::gap_type      gap_type;
    typedef Alignment::index_type           offset_type;
    
    struct statistics_type
    {
      size_type sentences;
      size_type tagged;
      size_type malformed;
      size_type inconsistent;
      size_type unused;
      size_type unreachable;
      
      statistics_type() : sentences(0), tagged(0), malformed(0), inconsistent(0), unused(0), unreachable(0) {}
      
      statistics_type& operator+=(const statistics_type& x)
      {
	sentences    += x.sentences;
	tagged       += x.tagged;
	malformed    += x.malformed;
	inconsistent += x.inconsistent;
	unused       += x.unused;
	unreachable  += x.unreachable;
	return *this;
      }
      
      void clear() { *this = statistics_type(); }
    };
    
  private:
    typedef std::vector<std::string, std::allocator<std::string> > result_set_type;
    
    typedef boost::mutex              mutex_type;
    typedef boost::mutex::scoped_lock lock_type;
    
  public:
    Document(const strategy_type __strategy=MarkupReinserter::COMPLETE_MAPPING,
	     const gap_type __max_gap_size=0,
	     const offset_type __source_offset=0,
	     const offset_type __target_offset=0,
	     const int __debug=0)
      : reinserter(__strategy, __max_gap_size),
	source_offset(__source_offset),
	target_offset(__target_offset),
	debug(__debug) {}
    
  private:
    Document(const Document& x) {}
    Document& operator=(const Document& x) { return *this; }
    
  public:
    // reinsert the tags of source into translation and keep the result
    // as the id-th sentence. an empty alignment is looked up in the
    // alignment table. a malformed alignment yields the translation
    // without tags, so does unbalanced markup in the source.
    std::string operator()(const id_type id,
			   const std::string& source,
			   const std::string& translation,
			   const std::string& alignment);
    
    std::string operator()(const std::string& source,
			   const std::string& translation,
			   const std::string& alignment)
    {
      return operator()(size_type(-1), source, translation, alignment);
    }
    
    // empty when the id-th sentence is not processed
    std::string result(const id_type id) const;
    size_type size() const;
    
    statistics_type statistics() const;
    
    void clear();
    
  public:
    MarkupReinserter reinserter;
    offset_type      source_offset;
    offset_type      target_offset;
    AlignmentTable   alignments;
    int              debug;
    
  private:
    mutable mutex_type __mutex;
    result_set_type    __results;
    statistics_type    __stats;
  };
  
  // documents under translation, managed by their ids
  class DocumentMap
  {
  public:
    typedef std::string                  id_type;
    typedef boost::shared_ptr<Document>  document_ptr_type;
    typedef size_t                       size_type;
    
  private:
    typedef std::map<id_type, document_ptr_type, std::less<id_type>,
		     std::allocator<std::pair<const id_type, document_ptr_type> > > document_map_type;
    
    typedef boost::mutex              mutex_type;
    typedef boost::mutex::scoped_lock lock_type;
    
  public:
    DocumentMap() {}
    
  private:
    DocumentMap(const DocumentMap& x) {}
    DocumentMap& operator=(const DocumentMap& x) { return *this; }
    
  public:
    // null when not found
    document_ptr_type find(const id_type& id) const
    {
      lock_type lock(__mutex);
      
      document_map_type::const_iterator iter = __documents.find(id);
      return (iter != __documents.end() ? iter->second : document_ptr_type());
    }
    
    // false when id is already taken
    bool insert(const id_type& id, const document_ptr_type& document)
    {
      lock_type lock(__mutex);
      
      return __documents.insert(std::make_pair(id, document)).second;
    }
    
    bool erase(const id_type& id)
    {
      lock_type lock(__mutex);
      
      return __documents.erase(id);
    }
    
    size_type size() const
    {
      lock_type lock(__mutex);
      
      return __documents.size();
    }
    
    void clear()
    {
      lock_type lock(__mutex);
      
      __documents.clear();
    }
    
  private:
    mutable mutex_type __mutex;
    document_map_type  __documents;
  };
};

#endif
