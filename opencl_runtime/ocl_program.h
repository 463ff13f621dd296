#include <map>
#include <memory>
#include <string>
#include <vector>
#include <optional>
#include <utils/common.h>
#include <opencl_runtime/ocl_common.h>
#include <opencl_runtime/ocl_context.h>

#pragma once

//INT_SRC: source embedded in the binary, EXT_SRC: source read from a file
enum struct kernel_t { INT_SRC, EXT_SRC };

struct kernel_desc
{
  kernel_t    _kernel_type;
  std::string _kernel_name;
  //file location for EXT_SRC, source text for INT_SRC
  std::optional<std::string> _kernel_definition;

  std::string get_kernel_name() const { return _kernel_name; }
  kernel_t get_kernel_type() const { return _kernel_type; }
  std::optional<std::string> get_kernel_def() const { return _kernel_definition; }
};

status read_kernel_source( const kernel_desc&, std::string& );

//non-owning handle to a kernel created by an ocl_program
struct entry_point_handle
{
  std::string name;
  cl_kernel   kernel = nullptr;
};

class ocl_program
{

  public:

    static status compile( const ocl_context&, const std::string&, std::unique_ptr<ocl_program>& );

    status lookup_entry_point( const std::string&, entry_point_handle& );

    //kernel names declared by the program
    std::vector<std::string> kernel_names() const;

    cl_program get() const { return _program; }

    ~ocl_program();

    ocl_program( const ocl_program& ) = delete;
    ocl_program& operator=( const ocl_program& ) = delete;

  private:

    ocl_program() = default;

    static std::string _get_build_log( cl_program, cl_device_id );

    cl_program  _program = nullptr;
    std::map<std::string, std::optional<cl_kernel> > _kernels;

};
