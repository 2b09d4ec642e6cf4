#ifndef SAMPLESPLIT_FILE_H
#define SAMPLESPLIT_FILE_H

#include <stdint.h>
#include <string>

/**
   File is a container for a standard file descriptor that supports opening
   and closing and blocking reads and writes.
 */
class File {
public:
  /// Access modes that the file can be opened in
  enum AccessMode {
    READ, /** open for reading */
    WRITE, /** open for writing */
    APPEND, /** open for writing at the end of the file */
    READ_WRITE, /** open for reading and writing */
    CLOSED /** file isn't currently open in any mode */
  };

  /// Constructor
  /**
     \param filename the path to the file
   */
  File(const std::string& filename);

  /// Destructor
  /**
     \warning Aborts if the file is still open
   */
  virtual ~File();

  /// Open the file
  /**
     \param mode the access mode in which to open the file

     \param create if true, create the file if it doesn't exist, truncating
     it if it does
   */
  void open(AccessMode mode, bool create = false);

  /**
     Read the remainder of the file into a string.

     \param[out] contents the string that will hold the file's contents
   */
  void readAll(std::string& contents);

  /// Write a buffer to the file
  /**
     \param buffer the buffer from which to write

     \param size the number of bytes to write

     \param maxWriteSize the maximum size of a single write() syscall
   */
  void write(const uint8_t* buffer, uint64_t size, uint64_t maxWriteSize = 0);

  /// Write a string to the file
  /**
     \param str the string to write
   */
  void write(const std::string& str);

  /// Flush the contents of the file from internal buffers
  void sync() const;

  /// Close the file
  void close();

private:
  const std::string filename;
  AccessMode currentMode;

  int fileDescriptor;
};

#endif // SAMPLESPLIT_FILE_H
