#include <span>
#include <memory>
#include <utils/common.h>
#include <opencl_runtime/ocl_common.h>
#include <opencl_runtime/ocl_buffers.h>

#pragma once

/* Read-mapped, zero-copy window over a retired buffer.
 * Unmaps when destroyed. */
template<typename T>
class mapped_view
{

  public:

    mapped_view() = default;

    mapped_view( shared_buffer * buffer, T * ptr, size_t count )
    : _buffer( buffer ), _ptr( ptr ), _count( count ) {}

    ~mapped_view()
    {
      if( _buffer && _ptr )
        if( auto st = _buffer->unmap( _ptr ); !st )
          std::cerr << "mapped_view : " << st.describe() << std::endl;
    }

    mapped_view( const mapped_view& ) = delete;
    mapped_view& operator=( const mapped_view& ) = delete;

    std::span<const T> values() const { return { _ptr, _count }; }

    size_t size() const { return _count; }

    const T& operator[]( size_t i ) const { return _ptr[i]; }

  private:

    shared_buffer * _buffer = nullptr;
    T *             _ptr    = nullptr;
    size_t          _count  = 0;

};

//first count elements of a retired FLOAT32 buffer
status read_all( shared_buffer&, size_t count, std::unique_ptr<mapped_view<float> >& );
