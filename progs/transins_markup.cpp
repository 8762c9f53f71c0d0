//
//  Copyright(C) 2020 transins developers
//

// tagged sentence filter: mask tags, unmask them or remove the blanks
// inside of tags

#include <iostream>
#include <string>
#include <stdexcept>

#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>

#include "transins/masker.hpp"
#include "transins/tokens.hpp"

#include "utils/compress_stream.hpp"

typedef boost::filesystem::path path_type;

path_type input_file = "-";
path_type output_file = "-";

bool mask_mode = false;
bool unmask_mode = false;
bool detokenize_mode = false;

int debug = 0;

void options(int argc, char** argv);

int main(int argc, char** argv)
{
  try {
    options(argc, argv);
    
    if (int(mask_mode) + unmask_mode + detokenize_mode != 1)
      throw std::runtime_error("one of --mask, --unmask or --detokenize");
    
    const transins::Masker masker;
    
    utils::compress_istream is(input_file, 1024 * 1024);
    
    const bool flush_output = (output_file == "-"
			       || (boost::filesystem::exists(output_file)
				   && ! boost::filesystem::is_regular_file(output_file)));
    
    utils::compress_ostream os(output_file, 1024 * 1024 * (! flush_output));
    
    transins::tokens_type tokens;
    std::string line;
    size_t lines = 0;
    
    while (std::getline(is, line)) {
      if (mask_mode) {
	transins::split(line, tokens);
	os << masker.mask(tokens) << '\n';
      } else if (unmask_mode)
	os << masker.unmask(line) << '\n';
      else
	os << masker.detokenize(line) << '\n';
      
      ++ lines;
    }
    
    if (debug)
      std::cerr << "lines: " << lines << std::endl;
  }
  catch (const std::exception& err) {
    std::cerr << "error: " << err.what() << std::endl;
    return 1;
  }
  return 0;
}

void options(int argc, char** argv)
{
  namespace po = boost::program_options;
  
  po::options_description desc("options");
  desc.add_options()
    ("input",  po::value<path_type>(&input_file)->default_value(input_file),   "input file")
    ("output", po::value<path_type>(&output_file)->default_value(output_file), "output file")
    
    ("mask",       po::bool_switch(&mask_mode),       "ornament tags with their neighbouring characters")
    ("unmask",     po::bool_switch(&unmask_mode),     "remove ornaments of tags")
    ("detokenize", po::bool_switch(&detokenize_mode), "remove blanks inside of tags")
    
    ("debug", po::value<int>(&debug)->implicit_value(1), "debug level")
    ("help", "help message");
  
  po::variables_map vm;
  po::store(po::parse_command_line(argc, argv, desc, po::command_line_style::unix_style & (~po::command_line_style::allow_guessing)), vm);
  po::notify(vm);
  
  if (vm.count("help")) {
    std::cout << argv[0] << " [options]" << '\n' << desc << '\n';
    exit(0);
  }
}
