//
//  Copyright(C) 2020 transins developers
//

// reinsert markup into translations
//
// each input line is
//
//   tagged source ||| translation [||| alignment]
//
// and each output line is the tagged translation. a missing alignment
// is looked up in the --alignments file.

#include <iostream>
#include <vector>
#include <string>
#include <utility>
#include <stdexcept>
#include <algorithm>

#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>
#include <boost/thread.hpp>
#include <boost/algorithm/string/trim.hpp>

#include "transins/document.hpp"
#include "transins/masker.hpp"
#include "transins/tokens.hpp"

#include "utils/compress_stream.hpp"
#include "utils/bounded_queue.hpp"
#include "utils/resource.hpp"

typedef boost::filesystem::path path_type;

typedef transins::Document       document_type;
typedef transins::MarkupReinserter reinserter_type;

path_type input_file = "-";
path_type output_file = "-";
path_type alignment_file;

std::string strategy_name = "complete";
int max_gap_size = 0;

int source_offset = 0;
int target_offset = 0;

bool mask_mode = false;
bool detokenize_mode = false;

bool strategy_list = false;
bool alignment_list = false;

int threads = 1;

int debug = 0;

void reinsert(document_type& document);
void options(int argc, char** argv);

int main(int argc, char** argv)
{
  try {
    options(argc, argv);
    
    if (strategy_list) {
      std::cout << reinserter_type::lists();
      return 0;
    }
    
    if (alignment_list) {
      std::cout << transins::Alignment::lists();
      return 0;
    }
    
    if (mask_mode && detokenize_mode)
      throw std::runtime_error("either --mask or --detokenize");
    
    threads = std::max(1, threads);
    
    document_type document(reinserter_type::parse_strategy(strategy_name),
			   max_gap_size,
			   source_offset,
			   target_offset,
			   debug);
    
    if (! alignment_file.empty()) {
      if (alignment_file != "-" && ! boost::filesystem::exists(alignment_file))
	throw std::runtime_error("no alignment file: " + alignment_file.string());
      
      document.alignments.read(alignment_file);
      
      if (debug)
	std::cerr << "alignments: " << document.alignments.size() << std::endl;
    }
    
    utils::resource start;
    
    reinsert(document);
    
    utils::resource end;
    
    if (debug) {
      const document_type::statistics_type stats = document.statistics();
      
      std::cerr << "sentences: "           << stats.sentences << std::endl
		<< "tagged sentences: "    << stats.tagged << std::endl
		<< "malformed alignments: " << stats.malformed << std::endl
		<< "inconsistent markup: " << stats.inconsistent << std::endl
		<< "unused tags: "         << stats.unused << std::endl
		<< "unreachable points: "  << stats.unreachable << std::endl;
      
      std::cerr << (end - start) << std::endl;
    }
  }
  catch (const std::exception& err) {
    std::cerr << "error: " << err.what() << std::endl;
    return 1;
  }
  return 0;
}

struct Task
{
  typedef std::pair<size_t, std::string> line_type;
  
  typedef utils::bounded_queue<line_type, std::allocator<line_type> > queue_type;
  
  Task(queue_type& __queue, document_type& __document)
    : queue(__queue), document(__document) {}
  
  void operator()()
  {
    static const std::string delimiter = "|||";
    
    line_type line;
    
    for (;;) {
      queue.pop_swap(line);
      if (line.first == size_t(-1)) break;
      
      std::string fields[3];
      
      std::string::size_type first = 0;
      for (int i = 0; i != 3; ++ i) {
	const std::string::size_type last = (i == 2 ? std::string::npos : line.second.find(delimiter, first));
	
	fields[i] = boost::algorithm::trim_copy(line.second.substr(first, last == std::string::npos ? last : last - first));
	
	if (last == std::string::npos) break;
	first = last + delimiter.size();
      }
      
      document(line.first, fields[0], fields[1], fields[2]);
    }
  }
  
  queue_type&    queue;
  document_type& document;
};

void reinsert(document_type& document)
{
  typedef Task task_type;
  
  task_type::queue_type queue(threads * 64);
  
  boost::thread_group workers;
  for (int i = 0; i != threads; ++ i)
    workers.add_thread(new boost::thread(task_type(queue, document)));
  
  size_t id = 0;
  {
    utils::compress_istream is(input_file, 1024 * 1024);
    
    std::string line;
    for (/**/; std::getline(is, line); ++ id) {
      task_type::line_type value(id, std::string());
      value.second.swap(line);
      
      queue.push_swap(value);
    }
  }
  
  for (int i = 0; i != threads; ++ i)
    queue.push(task_type::line_type(size_t(-1), std::string()));
  
  workers.join_all();
  
  const bool flush_output = (output_file == "-"
			     || (boost::filesystem::exists(output_file)
				 && ! boost::filesystem::is_regular_file(output_file)));
  
  utils::compress_ostream os(output_file, 1024 * 1024 * (! flush_output));
  
  const transins::Masker masker;
  
  transins::tokens_type tokens;
  for (size_t i = 0; i != id; ++ i) {
    const std::string tagged = document.result(i);
    
    if (mask_mode) {
      transins::split(tagged, tokens);
      os << masker.mask(tokens) << '\n';
    } else if (detokenize_mode)
      os << masker.detokenize(tagged) << '\n';
    else
      os << tagged << '\n';
  }
}

void options(int argc, char** argv)
{
  namespace po = boost::program_options;
  
  po::options_description opts_config("configuration options");
  opts_config.add_options()
    ("input",      po::value<path_type>(&input_file)->default_value(input_file),   "input file")
    ("output",     po::value<path_type>(&output_file)->default_value(output_file), "output file")
    ("alignments", po::value<path_type>(&alignment_file),                          "annotated alignments")
    
    ("strategy",      po::value<std::string>(&strategy_name)->default_value(strategy_name), "reinsertion strategy")
    ("strategy-list", po::bool_switch(&strategy_list),                                      "list of available strategies")
    ("max-gap-size",  po::value<int>(&max_gap_size)->default_value(max_gap_size),           "maximum gap of interpolated tags")
    
    ("alignment-list", po::bool_switch(&alignment_list), "list of alignment formats")
    ("source-offset",  po::value<int>(&source_offset)->default_value(source_offset), "offset added to source indexes")
    ("target-offset",  po::value<int>(&target_offset)->default_value(target_offset), "offset added to target indexes")
    
    ("mask",       po::bool_switch(&mask_mode),       "ornament tags with their neighbouring characters")
    ("detokenize", po::bool_switch(&detokenize_mode), "remove blanks inside of tags");
  
  po::options_description opts_command("command line options");
  opts_command.add_options()
    ("config",  po::value<path_type>(),                    "configuration file")
    ("threads", po::value<int>(&threads),                  "# of threads")
    ("debug",   po::value<int>(&debug)->implicit_value(1), "debug level")
    ("help", "help message");
  
  po::options_description desc_config;
  po::options_description desc_command;
  
  desc_config.add(opts_config);
  desc_command.add(opts_config).add(opts_command);
  
  po::variables_map variables;
  
  po::store(po::parse_command_line(argc, argv, desc_command, po::command_line_style::unix_style & (~po::command_line_style::allow_guessing)), variables);
  if (variables.count("config")) {
    const path_type path_config = variables["config"].as<path_type>();
    if (! boost::filesystem::exists(path_config))
      throw std::runtime_error("no config file: " + path_config.string());
    
    utils::compress_istream is(path_config);
    po::store(po::parse_config_file(is, desc_config), variables);
  }
  
  po::notify(variables);
  
  if (variables.count("help")) {
    std::cout << argv[0] << " [options]\n"
	      << desc_command << std::endl;
    exit(0);
  }
}
