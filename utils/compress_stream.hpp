// -*- mode: c++ -*-
//
//  Copyright(C) 2009-2010 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __UTILS__COMPRESS_STREAM__HPP__
#define __UTILS__COMPRESS_STREAM__HPP__ 1

#include <cstring>
#include <stdexcept>
#include <string>
#include <fstream>

#include <unistd.h>

#include <boost/iostreams/filtering_stream.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filter/bzip2.hpp>
#include <boost/iostreams/device/file_descriptor.hpp>
#include <boost/iostreams/device/file.hpp>

#include <boost/filesystem.hpp>

// streams over plain, gzip or bzip2 files. "-" denotes stdin/stdout.
// input format is detected by magic bytes, output format by extension.

namespace utils
{
  namespace impl
  {
    typedef enum {
      COMPRESS_STREAM_GZIP,
      COMPRESS_STREAM_BZIP,
      COMPRESS_STREAM_UNKNOWN
    } compress_format_type;
    
    inline
    compress_format_type compress_iformat(const boost::filesystem::path& path)
    {
      char buffer[4];
      
      ::memset(buffer, 0, sizeof(buffer));
      std::ifstream ifs(path.string().c_str());
      ifs.read(buffer, 3);
      
      if (buffer[0] == '\037' && buffer[1] == '\213')
	return COMPRESS_STREAM_GZIP;
      else if (buffer[0] == 'B' && buffer[1] == 'Z' && buffer[2] == 'h')
	return COMPRESS_STREAM_BZIP;
      else
	return COMPRESS_STREAM_UNKNOWN;
    }
    
    inline
    compress_format_type compress_oformat(const boost::filesystem::path& path)
    {
      const std::string extension = path.extension().string();
      
      if (extension == ".gz")
	return COMPRESS_STREAM_GZIP;
      else if (extension == ".bz2")
	return COMPRESS_STREAM_BZIP;
      else
	return COMPRESS_STREAM_UNKNOWN;
    }
  };
  
  template <typename Stream>
  inline
  Stream& push_compress_ostream(Stream& os, const boost::filesystem::path& path, size_t buffer_size)
  {
    if (path == "-")
      os.push(boost::iostreams::file_descriptor_sink(::dup(STDOUT_FILENO), boost::iostreams::close_handle), buffer_size);
    else {
      switch (impl::compress_oformat(path)) {
      case impl::COMPRESS_STREAM_GZIP:
	os.push(boost::iostreams::gzip_compressor());
	break;
      case impl::COMPRESS_STREAM_BZIP:
	os.push(boost::iostreams::bzip2_compressor());
	break;
      default: break;
      }
      os.push(boost::iostreams::file_sink(path.string(), std::ios_base::out | std::ios_base::trunc), buffer_size);
    }
    return os;
  }
  
  template <typename Stream>
  inline
  Stream& push_compress_istream(Stream& is, const boost::filesystem::path& path, size_t buffer_size)
  {
    if (path == "-")
      is.push(boost::iostreams::file_descriptor_source(::dup(STDIN_FILENO), boost::iostreams::close_handle), buffer_size);
    else {
      if (! boost::filesystem::exists(path))
	throw std::runtime_error("no file: " + path.string());
      
      if (boost::filesystem::is_regular_file(path))
	switch (impl::compress_iformat(path)) {
	case impl::COMPRESS_STREAM_GZIP:
	  is.push(boost::iostreams::gzip_decompressor());
	  break;
	case impl::COMPRESS_STREAM_BZIP:
	  is.push(boost::iostreams::bzip2_decompressor());
	  break;
	default: break;
	}
      is.push(boost::iostreams::file_source(path.string()), buffer_size);
    }
    return is;
  }
  
  class compress_ostream : public boost::iostreams::filtering_ostream
  {
  public:
    typedef boost::filesystem::path path_type;
    
  public:
    compress_ostream(const path_type& path, size_t buffer_size = 4096)
    {
      push_compress_ostream(static_cast<boost::iostreams::filtering_ostream&>(*this), path, buffer_size);
    }
  };
  
  class compress_istream : public boost::iostreams::filtering_istream
  {
  public:
    typedef boost::filesystem::path path_type;
    
  public:
    compress_istream(const path_type& path, size_t buffer_size = 4096)
    {
      push_compress_istream(static_cast<boost::iostreams::filtering_istream&>(*this), path, buffer_size);
    }
  };
  
};

#endif
