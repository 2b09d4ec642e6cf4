#ifndef _SAMPLESPLIT_STATUSPRINTER_H
#define _SAMPLESPLIT_STATUSPRINTER_H

#include <map>
#include <ostream>
#include <pthread.h>
#include <queue>
#include <stdarg.h>
#include <stdlib.h>
#include <string>

#include "core/Thread.h"

class Params;

/**
   A thread-safe printer for printing statistics and status messages to a log
   file. Messages are queued by the caller and written by a dedicated thread,
   so logging from partition tasks never blocks on file I/O.
 */
class StatusPrinter {
public:
  /** \enum Channel
     The status printer can print to any one of a number of channels.
     Channels distinguish themselves by writing the channel's header at the
     beginning of the log line. The header for a channel is given by the
     CHANNEL_XXX_HEADER parameter, where XXX is replaced with the name of the
     channel, and defaults to the channel name.
  */
  enum Channel {CH_STATUS,/**< use this channel for general status messages */
                CH_STATISTIC, /**< use this channel when logging statistics */
                CH_PARAM, /**< use this channel when logging parameters */
                CH_ADVISORY /**< use this channel for non-fatal warnings */
  };

  /// Initialize the status printer.
  /**
     Note that this does not start the printer; for that, use
     StatusPrinter::spawn.

     If the provided Params object has defined the parameter LOG_FILE, the
     value of that parameter will be used as the path to the log file.
     Otherwise, a file named after the host will be placed in the directory
     given by the LOG_DIR parameter.

     \param params the Params object containing configuration information for
     the printer
   */
  static void init(Params* params);

  /// Tear down the status printer
  /**
     If the status printer is running, this method stops it after writing
     every pending message.
   */
  static void teardown();

  /// Log a message
  /**
     \param channel the channel on which to log
     \param message the message to log
   */
  static void add(const Channel& channel, const std::string& message);

  /// Log a message (printf-style syntax)
  /**
     \param channel the channel on which to log
     \param messageFormat the printf-style format of the message to log
     \param ... the formatting parameters
   */
  static void add(const Channel& channel, const char* messageFormat ...);

  /// Log a message to the StatusPrinter::CH_STATUS channel
  static void add(const std::string& message);

  /// Log a message to the StatusPrinter::CH_STATUS channel
  static void add(const char* messageFormat ...);

  /// Flush the log file's stream
  static void flush();

  /// Start the status printer
  /**
     Start the status printer's thread. Messages added before this call are
     queued and written once the thread starts.

     \warning You should not call this method unless you have called
     StatusPrinter::init first.
   */
  static void spawn();

  /// \cond PRIVATE
  /**
     The status printer's main thread. Called by StatusPrinter::spawn()

     \param arg unused; always NULL
   */
  static void* run(void* arg);
  /// \endcond
private:
  static std::map<Channel, std::string> channelHeaders;

  static pthread_mutex_t statusPrintMutex;
  static pthread_cond_t messageQueueNotEmpty;

  static samplesplit::Thread thread;
  static bool stop;

  static void add(const Channel& channel, const char* messageFormat,
                  va_list& ap);
  static void printNextMessage();

  static std::ostream* outputStream;

  static std::queue<Channel> channelsForMessages;
  static std::queue<std::string> messages;

  static std::string getHostLogName(Params* params);
}; // StatusPrinter

#endif // _SAMPLESPLIT_STATUSPRINTER_H
