#pragma once

/* Entry points for CLI modes.
   Each function parses argv options and runs the selected mode.
   Return value: 0 on success, non-zero on error. */

/* Compare one or more candidates against a reference video.
   Example:
     vqeval-cli compare --ref=orig.mp4 --cand=h264.mp4,mjpeg.avi --labels=H.264,M-JPEG */
int run_compare(int argc, char** argv);

/* Print container metadata of one source.
   Example:
     vqeval-cli probe --file=orig.mp4 */
int run_probe  (int argc, char** argv);

/* Serve evaluations over gRPC until Enter is pressed.
   Example:
     vqeval-cli serve --port=50061 --max-concurrent=2 */
int run_serve  (int argc, char** argv);

/* Evaluate through a running server.
   Example:
     vqeval-cli remote --server=localhost:50061 --ref=/data/orig.mp4 --cand=/data/h264.mp4 --stream */
int run_remote (int argc, char** argv);
